#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/core/quaternion.hpp>

#include "framesync/motion/pose.hpp"
#include "framesync/projection/calibration.hpp"

namespace framesync::projection {

// Points closer than this along the camera forward axis are not projected.
inline constexpr double kMinProjectionDepth = 0.1;

// Immutable calibration plus the intrinsics derived from it. Safe to share
// across threads for the duration of a batch.
class ProjectionSnapshot {
 public:
  // Throws std::invalid_argument when the field of view is outside (0, 180).
  ProjectionSnapshot(const CalibrationTransform& calibration, int width, int height);

  const CalibrationTransform& calibration() const;
  const CameraIntrinsics& intrinsics() const;

  motion::Pose ApplyCalibration(const motion::Pose& pose) const;
  std::optional<cv::Point2d> Project(const cv::Vec3d& point_world,
                                     const motion::Pose& camera_pose,
                                     bool bounds_check = true) const;

 private:
  CalibrationTransform calibration_;
  CameraIntrinsics intrinsics_;
  cv::Quatd calibration_rotation_;
};

class CalibratedProjector {
 public:
  CalibratedProjector(int width, int height, const CalibrationTransform& calibration = {});

  // Starts from the stored calibration when the file exists, defaults otherwise.
  static CalibratedProjector FromFile(const std::filesystem::path& path, int width, int height);

  std::shared_ptr<const ProjectionSnapshot> Snapshot() const;
  CalibrationTransform calibration() const;
  // Returns false and keeps the current snapshot when the calibration is invalid.
  bool SetCalibration(const CalibrationTransform& calibration);

  void Save(const std::filesystem::path& path) const;
  bool Load(const std::filesystem::path& path, std::string* error_message = nullptr);

  int width() const;
  int height() const;

 private:
  int width_ = 0;
  int height_ = 0;
  mutable std::mutex mutex_;
  std::shared_ptr<const ProjectionSnapshot> snapshot_;
};

}  // namespace framesync::projection
