#include "framesync/io/session_config.hpp"

#include <exception>
#include <stdexcept>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace framesync::io {
namespace {

std::filesystem::path ResolvePath(const YAML::Node& node, const std::filesystem::path& base_dir) {
  if (!node) {
    return {};
  }
  const std::filesystem::path path = node.as<std::string>();
  if (path.empty() || path.is_absolute()) {
    return path;
  }
  return (base_dir / path).lexically_normal();
}

template <typename T>
T ReadOr(const YAML::Node& node, const char* key, T fallback) {
  const YAML::Node value = node[key];
  if (!value) {
    return fallback;
  }
  return value.as<T>();
}

}  // namespace

OverlayStyle ParseOverlayStyle(std::string_view name) {
  if (name == "gizmo") {
    return OverlayStyle::kGizmo;
  }
  if (name == "comparison") {
    return OverlayStyle::kComparison;
  }
  throw std::runtime_error(fmt::format("Unknown overlay style: {}", name));
}

std::string_view OverlayStyleName(OverlayStyle style) {
  switch (style) {
    case OverlayStyle::kGizmo:
      return "gizmo";
    case OverlayStyle::kComparison:
      return "comparison";
  }
  return "gizmo";
}

SessionConfig LoadSessionConfig(const std::filesystem::path& config_path) {
  if (!std::filesystem::exists(config_path)) {
    throw std::runtime_error(fmt::format("Session config not found: {}", config_path.string()));
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const std::exception& ex) {
    throw std::runtime_error(fmt::format("Failed to parse session config {}: {}", config_path.string(), ex.what()));
  }

  const std::filesystem::path base_dir = config_path.parent_path();

  SessionConfig config;
  try {
    config.video_path = ResolvePath(root["video_path"], base_dir);
    config.frame_timestamps_path = ResolvePath(root["frame_timestamps_path"], base_dir);
    config.motion_path = ResolvePath(root["motion_path"], base_dir);
    config.output_dir = ResolvePath(root["output_dir"], base_dir);
    config.calibration_path = ResolvePath(root["calibration_path"], base_dir);
    config.timestamp_offset = ReadOr(root, "timestamp_offset", config.timestamp_offset);
    config.image_width = ReadOr(root, "image_width", config.image_width);
    config.image_height = ReadOr(root, "image_height", config.image_height);

    const YAML::Node options = root["options"];
    if (options) {
      config.options.gap_threshold = ReadOr(options, "gap_threshold", config.options.gap_threshold);
      config.options.export_synced_json = ReadOr(options, "export_synced_json", config.options.export_synced_json);
      config.options.render_overlay = ReadOr(options, "render_overlay", config.options.render_overlay);
      if (const YAML::Node style = options["overlay_style"]) {
        config.options.overlay_style = ParseOverlayStyle(style.as<std::string>());
      }
      config.options.use_compressed = ReadOr(options, "use_compressed", config.options.use_compressed);
      config.options.worker_threads = ReadOr(options, "worker_threads", config.options.worker_threads);
    }
  } catch (const YAML::Exception& ex) {
    throw std::runtime_error(fmt::format("Invalid value in session config {}: {}", config_path.string(), ex.what()));
  }

  if (config.motion_path.empty()) {
    throw std::runtime_error(fmt::format("Session config {} is missing motion_path", config_path.string()));
  }
  if (config.output_dir.empty()) {
    throw std::runtime_error(fmt::format("Session config {} is missing output_dir", config_path.string()));
  }
  if (config.video_path.empty() && config.frame_timestamps_path.empty()) {
    throw std::runtime_error(
        fmt::format("Session config {} needs video_path or frame_timestamps_path", config_path.string()));
  }
  return config;
}

}  // namespace framesync::io
