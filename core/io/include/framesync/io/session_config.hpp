#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace framesync::io {

// gizmo draws the synced pose axes; comparison draws the nearest raw sample
// next to the synced hand point.
enum class OverlayStyle { kGizmo, kComparison };

OverlayStyle ParseOverlayStyle(std::string_view name);
std::string_view OverlayStyleName(OverlayStyle style);

struct SessionOptions {
  double gap_threshold = 0.2;
  bool export_synced_json = true;
  bool render_overlay = false;
  OverlayStyle overlay_style = OverlayStyle::kGizmo;
  bool use_compressed = true;
  int worker_threads = 0;
};

struct SessionConfig {
  std::filesystem::path video_path;
  std::filesystem::path frame_timestamps_path;
  std::filesystem::path motion_path;
  std::filesystem::path output_dir;
  std::filesystem::path calibration_path;
  double timestamp_offset = 0.0;
  int image_width = 1920;
  int image_height = 1080;
  SessionOptions options;
};

// Relative paths in the file are resolved against the file's directory.
SessionConfig LoadSessionConfig(const std::filesystem::path& config_path);

}  // namespace framesync::io
