#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "framesync/motion/motion_track.hpp"
#include "framesync/motion/pose.hpp"
#include "framesync/motion/time_matcher.hpp"
#include "framesync/projection/calibrated_projector.hpp"

namespace framesync::sync {

inline constexpr double kDefaultGapThreshold = 0.2;

struct SyncOptions {
  double timestamp_offset = 0.0;
  double gap_threshold = kDefaultGapThreshold;
};

struct SyncedFrame {
  std::size_t frame_index = 0;
  motion::FrameMatch match;
  std::optional<motion::Pose> hand_pose;
  std::optional<motion::Pose> camera_pose;
  std::optional<cv::Point2d> hand_pixel;
};

struct SyncSummary {
  std::size_t total_frames = 0;
  std::size_t frames_with_pose = 0;
  std::size_t gapped_frames = 0;
  std::size_t projected_frames = 0;
};

// Camera pose from the eye poses: midpoint position with the left-eye rotation
// when both exist, otherwise whichever eye is present.
std::optional<motion::Pose> CameraPoseFromEyes(const std::optional<motion::Pose>& left_eye,
                                               const std::optional<motion::Pose>& right_eye);

class FrameSynchronizer {
 public:
  FrameSynchronizer(const motion::MotionTrack& track, SyncOptions options);
  FrameSynchronizer(motion::MotionTrack&&, SyncOptions) = delete;

  SyncedFrame SyncFrame(std::size_t frame_index,
                        double frame_timestamp,
                        const projection::ProjectionSnapshot* snapshot = nullptr) const;

  // Frames are independent of each other and processed in parallel; output order
  // follows the input.
  std::vector<SyncedFrame> Run(const std::vector<double>& frame_timestamps,
                               const projection::ProjectionSnapshot* snapshot = nullptr) const;

  const SyncOptions& options() const;

 private:
  const motion::MotionTrack& track_;
  motion::TimeMatcher matcher_;
  SyncOptions options_;
};

SyncSummary Summarize(const std::vector<SyncedFrame>& frames);

}  // namespace framesync::sync
