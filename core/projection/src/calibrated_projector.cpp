#include "framesync/projection/calibrated_projector.hpp"

#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace framesync::projection {
namespace {

const CalibrationTransform& ValidatedCalibration(const CalibrationTransform& calibration) {
  if (!IsValidFieldOfView(calibration.field_of_view_deg)) {
    throw std::invalid_argument(
        fmt::format("Field of view must be in (0, 180) degrees, got {}", calibration.field_of_view_deg));
  }
  return calibration;
}

cv::Quatd RotationFromEulerDegrees(const cv::Vec3d& euler_deg) {
  const cv::Vec3d euler_rad = euler_deg * (CV_PI / 180.0);
  return cv::Quatd::createFromEulerAngles(euler_rad, cv::QuatEnum::INT_XYZ);
}

}  // namespace

ProjectionSnapshot::ProjectionSnapshot(const CalibrationTransform& calibration, int width, int height)
    : calibration_(ValidatedCalibration(calibration)),
      intrinsics_(CameraIntrinsics::FromFieldOfView(width, height, calibration.field_of_view_deg)),
      calibration_rotation_(RotationFromEulerDegrees(calibration.rotation_offset_euler_deg)) {}

const CalibrationTransform& ProjectionSnapshot::calibration() const {
  return calibration_;
}

const CameraIntrinsics& ProjectionSnapshot::intrinsics() const {
  return intrinsics_;
}

motion::Pose ProjectionSnapshot::ApplyCalibration(const motion::Pose& pose) const {
  motion::Pose calibrated = pose;
  calibrated.position = pose.position + calibration_.position_offset;
  calibrated.rotation = calibration_rotation_ * pose.rotation;
  return calibrated;
}

std::optional<cv::Point2d> ProjectionSnapshot::Project(const cv::Vec3d& point_world,
                                                       const motion::Pose& camera_pose,
                                                       bool bounds_check) const {
  const cv::Matx33d world_to_camera = camera_pose.rotation.inv().toRotMat3x3();
  cv::Vec3d local = world_to_camera * (point_world - camera_pose.position);

  // Tracking space is y-up, image space is y-down.
  local[1] = -local[1];

  if (local[2] <= kMinProjectionDepth) {
    return std::nullopt;
  }

  const cv::Vec3d homogeneous = intrinsics_.CameraMatrix() * local;
  const cv::Point2d pixel(homogeneous[0] / homogeneous[2], homogeneous[1] / homogeneous[2]);

  if (bounds_check) {
    const bool inside = pixel.x >= 0.0 && pixel.y >= 0.0 && pixel.x < static_cast<double>(intrinsics_.width) &&
                        pixel.y < static_cast<double>(intrinsics_.height);
    if (!inside) {
      return std::nullopt;
    }
  }
  return pixel;
}

CalibratedProjector::CalibratedProjector(int width, int height, const CalibrationTransform& calibration)
    : width_(width), height_(height), snapshot_(std::make_shared<const ProjectionSnapshot>(calibration, width, height)) {}

CalibratedProjector CalibratedProjector::FromFile(const std::filesystem::path& path, int width, int height) {
  std::string error_message;
  const auto calibration = LoadCalibration(path, &error_message);
  if (!calibration) {
    spdlog::warn("{}; using default calibration", error_message);
    return CalibratedProjector(width, height);
  }

  spdlog::info(
      "Loaded calibration {}: offset [{:.3f}, {:.3f}, {:.3f}], rotation [{:.1f}, {:.1f}, {:.1f}], fov {:.1f}",
      path.string(),
      calibration->position_offset[0],
      calibration->position_offset[1],
      calibration->position_offset[2],
      calibration->rotation_offset_euler_deg[0],
      calibration->rotation_offset_euler_deg[1],
      calibration->rotation_offset_euler_deg[2],
      calibration->field_of_view_deg);
  return CalibratedProjector(width, height, *calibration);
}

std::shared_ptr<const ProjectionSnapshot> CalibratedProjector::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_;
}

CalibrationTransform CalibratedProjector::calibration() const {
  return Snapshot()->calibration();
}

bool CalibratedProjector::SetCalibration(const CalibrationTransform& calibration) {
  if (!IsValidFieldOfView(calibration.field_of_view_deg)) {
    spdlog::warn("Ignoring calibration with field of view {}; keeping the current calibration",
                 calibration.field_of_view_deg);
    return false;
  }
  auto replacement = std::make_shared<const ProjectionSnapshot>(calibration, width_, height_);
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot_ = std::move(replacement);
  return true;
}

void CalibratedProjector::Save(const std::filesystem::path& path) const {
  SaveCalibration(path, calibration());
  spdlog::info("Saved calibration to {}", path.string());
}

bool CalibratedProjector::Load(const std::filesystem::path& path, std::string* error_message) {
  const auto calibration = LoadCalibration(path, error_message);
  if (!calibration) {
    return false;
  }
  return SetCalibration(*calibration);
}

int CalibratedProjector::width() const {
  return width_;
}

int CalibratedProjector::height() const {
  return height_;
}

}  // namespace framesync::projection
