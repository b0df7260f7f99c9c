#include "framesync/sync/synced_export.hpp"

#include <fstream>
#include <memory>
#include <stdexcept>

#include <fmt/format.h>
#include <json/json.h>
#include <spdlog/spdlog.h>

namespace framesync::sync {
namespace {

Json::Value PoseToJson(const motion::Pose& pose) {
  Json::Value value(Json::objectValue);
  Json::Value position(Json::arrayValue);
  for (int i = 0; i < 3; ++i) {
    position.append(pose.position[i]);
  }
  // Scalar-last, matching the motion records.
  Json::Value rotation(Json::arrayValue);
  rotation.append(pose.rotation.x);
  rotation.append(pose.rotation.y);
  rotation.append(pose.rotation.z);
  rotation.append(pose.rotation.w);
  value["position"] = position;
  value["rotation"] = rotation;
  value["gripper"] = pose.gripper;
  return value;
}

Json::Value OptionalPoseToJson(const std::optional<motion::Pose>& pose) {
  return pose ? PoseToJson(*pose) : Json::Value(Json::nullValue);
}

Json::Value FrameToJson(const SyncedFrame& frame) {
  Json::Value value(Json::objectValue);
  value["frame_idx"] = static_cast<Json::UInt64>(frame.frame_index);
  value["video_timestamp"] = frame.match.aligned_ts;
  value["interpolation_weight"] = frame.match.weight;
  value["in_gap"] = frame.match.gapped;
  value["hand_pose"] = OptionalPoseToJson(frame.hand_pose);
  value["camera_pose"] = OptionalPoseToJson(frame.camera_pose);

  if (frame.hand_pose && frame.match.prev_ts && frame.match.next_ts) {
    Json::Value source_timestamps(Json::arrayValue);
    source_timestamps.append(*frame.match.prev_ts);
    source_timestamps.append(*frame.match.next_ts);
    value["source_timestamps"] = source_timestamps;
  }

  if (frame.hand_pixel) {
    Json::Value pixel(Json::arrayValue);
    pixel.append(frame.hand_pixel->x);
    pixel.append(frame.hand_pixel->y);
    value["hand_pixel"] = pixel;
  } else {
    value["hand_pixel"] = Json::Value(Json::nullValue);
  }
  return value;
}

}  // namespace

void WriteSyncedPoses(const std::filesystem::path& path,
                      const std::vector<SyncedFrame>& frames,
                      const SyncedExportMetadata& metadata) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  std::ofstream stream(path, std::ios::trunc);
  if (!stream.is_open()) {
    throw std::runtime_error(fmt::format("Could not write synced poses: {}", path.string()));
  }

  const SyncSummary summary = Summarize(frames);

  Json::Value meta(Json::objectValue);
  meta["video_path"] = metadata.video_path;
  Json::Value sources(Json::arrayValue);
  for (const auto& source : metadata.motion_sources) {
    sources.append(source);
  }
  meta["motion_sources"] = sources;
  meta["total_frames"] = static_cast<Json::UInt64>(summary.total_frames);
  meta["fps"] = metadata.fps;
  meta["timestamp_offset"] = metadata.timestamp_offset;
  meta["gap_threshold"] = metadata.gap_threshold;
  meta["gaps_detected"] = static_cast<Json::UInt64>(summary.gapped_frames);

  Json::Value frame_list(Json::arrayValue);
  for (const SyncedFrame& frame : frames) {
    frame_list.append(FrameToJson(frame));
  }

  Json::Value root(Json::objectValue);
  root["metadata"] = meta;
  root["frames"] = frame_list;

  Json::StreamWriterBuilder writer;
  writer["indentation"] = "  ";
  const std::unique_ptr<Json::StreamWriter> json_writer(writer.newStreamWriter());
  json_writer->write(root, &stream);
  stream << '\n';

  spdlog::info("Synced poses written to {}", path.string());
}

}  // namespace framesync::sync
