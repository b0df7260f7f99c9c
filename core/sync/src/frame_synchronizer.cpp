#include "framesync/sync/frame_synchronizer.hpp"

#include <algorithm>
#include <limits>

#include <opencv2/core/utility.hpp>
#include <spdlog/spdlog.h>

#include "framesync/motion/pose_interpolator.hpp"

namespace framesync::sync {
namespace {

// cv::Range is int-indexed, so longer inputs are dispatched in several batches.
constexpr std::size_t kMaxFramesPerBatch = static_cast<std::size_t>(std::numeric_limits<int>::max());

}  // namespace

std::optional<motion::Pose> CameraPoseFromEyes(const std::optional<motion::Pose>& left_eye,
                                               const std::optional<motion::Pose>& right_eye) {
  if (left_eye && right_eye) {
    motion::Pose camera = *left_eye;
    camera.position = (left_eye->position + right_eye->position) * 0.5;
    return camera;
  }
  if (left_eye) {
    return left_eye;
  }
  return right_eye;
}

FrameSynchronizer::FrameSynchronizer(const motion::MotionTrack& track, SyncOptions options)
    : track_(track), matcher_(track), options_(options) {}

SyncedFrame FrameSynchronizer::SyncFrame(std::size_t frame_index,
                                         double frame_timestamp,
                                         const projection::ProjectionSnapshot* snapshot) const {
  SyncedFrame frame;
  frame.frame_index = frame_index;
  frame.match = matcher_.Match(frame_timestamp, options_.timestamp_offset, options_.gap_threshold);

  if (!frame.match.has_bracket() || frame.match.gapped) {
    return frame;
  }

  const std::size_t prev = *frame.match.prev_index;
  const std::size_t next = *frame.match.next_index;
  const double weight = frame.match.weight;

  if (prev == next) {
    frame.hand_pose = track_.SampleAt(prev).pose;
    frame.camera_pose = CameraPoseFromEyes(track_.Auxiliary(motion::kLeftEyeChannel, prev),
                                           track_.Auxiliary(motion::kRightEyeChannel, prev));
  } else {
    frame.hand_pose = motion::Interpolate(track_.SampleAt(prev).pose, track_.SampleAt(next).pose, weight);
    const auto left_eye = motion::Interpolate(track_.Auxiliary(motion::kLeftEyeChannel, prev),
                                              track_.Auxiliary(motion::kLeftEyeChannel, next),
                                              weight);
    const auto right_eye = motion::Interpolate(track_.Auxiliary(motion::kRightEyeChannel, prev),
                                               track_.Auxiliary(motion::kRightEyeChannel, next),
                                               weight);
    frame.camera_pose = CameraPoseFromEyes(left_eye, right_eye);
  }

  if (snapshot != nullptr && frame.camera_pose) {
    const motion::Pose calibrated_camera = snapshot->ApplyCalibration(*frame.camera_pose);
    frame.hand_pixel = snapshot->Project(frame.hand_pose->position, calibrated_camera, true);
  }
  return frame;
}

std::vector<SyncedFrame> FrameSynchronizer::Run(const std::vector<double>& frame_timestamps,
                                                const projection::ProjectionSnapshot* snapshot) const {
  if (track_.empty()) {
    spdlog::warn("No motion samples available; {} frames left without pose", frame_timestamps.size());
  }

  std::vector<SyncedFrame> frames(frame_timestamps.size());
  for (std::size_t begin = 0; begin < frames.size(); begin += kMaxFramesPerBatch) {
    const auto count = static_cast<int>(std::min(kMaxFramesPerBatch, frames.size() - begin));
    cv::parallel_for_(cv::Range(0, count), [&](const cv::Range& range) {
      for (int i = range.start; i < range.end; ++i) {
        const std::size_t index = begin + static_cast<std::size_t>(i);
        frames[index] = SyncFrame(index, frame_timestamps[index], snapshot);
      }
    });
  }

  const SyncSummary summary = Summarize(frames);
  spdlog::info(
      "Synchronized {} frames: {} with pose, {} in gaps, {} projected",
      summary.total_frames,
      summary.frames_with_pose,
      summary.gapped_frames,
      summary.projected_frames);
  return frames;
}

const SyncOptions& FrameSynchronizer::options() const {
  return options_;
}

SyncSummary Summarize(const std::vector<SyncedFrame>& frames) {
  SyncSummary summary;
  summary.total_frames = frames.size();
  for (const SyncedFrame& frame : frames) {
    if (frame.hand_pose) {
      ++summary.frames_with_pose;
    }
    if (frame.match.gapped) {
      ++summary.gapped_frames;
    }
    if (frame.hand_pixel) {
      ++summary.projected_frames;
    }
  }
  return summary;
}

}  // namespace framesync::sync
