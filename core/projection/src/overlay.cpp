#include "framesync/projection/overlay.hpp"

#include <cmath>

#include <opencv2/imgproc.hpp>

namespace framesync::projection {
namespace {

cv::Point ToPixel(const cv::Point2d& point) {
  return cv::Point(static_cast<int>(std::lround(point.x)), static_cast<int>(std::lround(point.y)));
}

}  // namespace

bool DrawPoseGizmo(cv::Mat& image,
                   const ProjectionSnapshot& snapshot,
                   const motion::Pose& pose,
                   const motion::Pose& camera_pose,
                   double axis_length) {
  const auto origin = snapshot.Project(pose.position, camera_pose);
  if (!origin) {
    return false;
  }

  const cv::Matx33d rotation = pose.rotation.toRotMat3x3();
  const cv::Vec3d axes[3] = {
      rotation * cv::Vec3d(axis_length, 0.0, 0.0),
      rotation * cv::Vec3d(0.0, axis_length, 0.0),
      rotation * cv::Vec3d(0.0, 0.0, axis_length),
  };
  const cv::Scalar colors[3] = {
      cv::Scalar(0, 0, 255),
      cv::Scalar(0, 255, 0),
      cv::Scalar(255, 0, 0),
  };

  constexpr int kThickness = 2;
  const cv::Point center = ToPixel(*origin);
  for (int axis = 0; axis < 3; ++axis) {
    // End points may leave the frame; cv::line clips them.
    const auto end = snapshot.Project(pose.position + axes[axis], camera_pose, false);
    if (end && std::isfinite(end->x) && std::isfinite(end->y)) {
      cv::line(image, center, ToPixel(*end), colors[axis], kThickness);
    }
  }
  cv::circle(image, center, 4, cv::Scalar(0, 255, 255), cv::FILLED);
  return true;
}

bool DrawHandPoint(cv::Mat& image,
                   const ProjectionSnapshot& snapshot,
                   const motion::Pose& pose,
                   const motion::Pose& camera_pose,
                   const cv::Scalar& color,
                   const std::string& label) {
  const auto pixel = snapshot.Project(pose.position, camera_pose);
  if (!pixel) {
    return false;
  }

  const cv::Point center = ToPixel(*pixel);
  cv::circle(image, center, 8, color, cv::FILLED);
  if (!label.empty()) {
    cv::putText(image, label, center + cv::Point(12, -12), cv::FONT_HERSHEY_SIMPLEX, 0.5, color, 1);
  }
  return true;
}

}  // namespace framesync::projection
