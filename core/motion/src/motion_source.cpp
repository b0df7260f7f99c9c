#include "framesync/motion/motion_source.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <json/json.h>
#include <spdlog/spdlog.h>

namespace framesync::motion {
namespace {

constexpr const char* kEyeFields[][2] = {
    {"left_eye_poses", "left_eye"},
    {"right_eye_poses", "right_eye"},
};

bool IsMotionRecordFile(const std::filesystem::path& path) {
  const std::string filename = path.filename().string();
  return path.extension() == ".json" && !filename.ends_with("metadata.json") && !filename.ends_with("validation.json");
}

// Stops at the first non-numeric entry; the remainder is treated as missing.
std::vector<double> ParsePoseArray(const Json::Value& value) {
  std::vector<double> values;
  if (!value.isArray()) {
    return values;
  }
  values.reserve(value.size());
  for (const auto& element : value) {
    if (!element.isNumeric()) {
      break;
    }
    values.push_back(element.asDouble());
  }
  return values;
}

std::vector<std::vector<double>> ParsePoseList(const Json::Value& value) {
  std::vector<std::vector<double>> poses;
  poses.reserve(value.size());
  for (const auto& element : value) {
    poses.push_back(ParsePoseArray(element));
  }
  return poses;
}

std::optional<std::vector<double>> ParseTimestamps(const Json::Value& value) {
  std::vector<double> timestamps;
  timestamps.reserve(value.size());
  for (const auto& element : value) {
    if (!element.isNumeric()) {
      return std::nullopt;
    }
    timestamps.push_back(element.asDouble());
  }
  return timestamps;
}

}  // namespace

MotionSource LoadMotionSource(const std::filesystem::path& path) {
  MotionSource source;
  source.name = path.filename().string();

  std::ifstream stream(path);
  if (!stream.is_open()) {
    spdlog::warn("Could not open motion record: {}", path.string());
    return source;
  }

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  if (!Json::parseFromStream(builder, stream, &root, &errors)) {
    spdlog::warn("Failed to parse motion record {}: {}", path.string(), errors);
    return source;
  }

  if (!root.isObject()) {
    spdlog::warn("Motion record is not a JSON object: {}", path.string());
    return source;
  }

  const Json::Value& trajectories = root["trajectories"];
  if (!trajectories.isArray() || trajectories.empty()) {
    spdlog::warn("No trajectories found in motion record: {}", path.string());
    return source;
  }

  const Json::Value& trajectory = trajectories[0];
  if (!trajectory.isObject()) {
    spdlog::warn("First trajectory is not a JSON object: {}", path.string());
    return source;
  }
  const Json::Value& timestamps = trajectory["timestamps"];
  const Json::Value& poses = trajectory["poses"];
  if (!timestamps.isArray() || !poses.isArray()) {
    spdlog::warn("Missing timestamps or poses in trajectory: {}", path.string());
    return source;
  }

  auto parsed_timestamps = ParseTimestamps(timestamps);
  if (!parsed_timestamps) {
    spdlog::warn("Non-numeric timestamp in trajectory: {}", path.string());
    return source;
  }

  RawTrajectory raw;
  raw.timestamps = std::move(*parsed_timestamps);
  raw.poses = ParsePoseList(poses);
  for (const auto& field : kEyeFields) {
    const Json::Value& eye_poses = trajectory[field[0]];
    if (eye_poses.isArray()) {
      raw.auxiliary_poses.emplace(field[1], ParsePoseList(eye_poses));
    }
  }

  spdlog::info("Loaded motion record {}: {} timestamps, {} poses", path.string(), raw.timestamps.size(), raw.poses.size());
  source.trajectory = std::move(raw);
  return source;
}

std::vector<MotionSource> LoadMotionSources(const std::filesystem::path& path) {
  if (std::filesystem::is_regular_file(path)) {
    return {LoadMotionSource(path)};
  }

  if (!std::filesystem::is_directory(path)) {
    throw std::runtime_error(fmt::format("Motion path not found: {}", path.string()));
  }

  std::vector<std::filesystem::path> files;
  for (const auto& entry : std::filesystem::directory_iterator(path)) {
    if (entry.is_regular_file() && IsMotionRecordFile(entry.path())) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());

  if (files.empty()) {
    spdlog::warn("No motion records found in {}", path.string());
  }

  std::vector<MotionSource> sources;
  sources.reserve(files.size());
  for (const auto& file : files) {
    sources.push_back(LoadMotionSource(file));
  }
  return sources;
}

}  // namespace framesync::motion
