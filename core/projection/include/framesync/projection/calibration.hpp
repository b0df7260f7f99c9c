#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace framesync::projection {

inline constexpr double kDefaultFieldOfViewDeg = 100.0;

struct CalibrationTransform {
  cv::Vec3d position_offset{0.0, 0.0, 0.0};
  cv::Vec3d rotation_offset_euler_deg{0.0, 0.0, 0.0};
  double field_of_view_deg = kDefaultFieldOfViewDeg;
};

// Horizontal field of view must lie strictly inside (0, 180) degrees.
bool IsValidFieldOfView(double field_of_view_deg);

// Pinhole model with a single horizontal field of view; the principal point is
// the image centre.
struct CameraIntrinsics {
  int width = 0;
  int height = 0;
  double focal_length = 0.0;
  double cx = 0.0;
  double cy = 0.0;

  static CameraIntrinsics FromFieldOfView(int width, int height, double field_of_view_deg);
  cv::Matx33d CameraMatrix() const;
};

std::optional<CalibrationTransform> LoadCalibration(const std::filesystem::path& path,
                                                    std::string* error_message = nullptr);
void SaveCalibration(const std::filesystem::path& path, const CalibrationTransform& calibration);

}  // namespace framesync::projection
