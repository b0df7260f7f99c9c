#include "framesync/motion/pose.hpp"

#include <cmath>

namespace framesync::motion {

Pose PoseFromArray(const double* values, std::size_t count) {
  Pose pose;
  if (values == nullptr) {
    return pose;
  }

  if (count >= 3) {
    pose.position = cv::Vec3d(values[0], values[1], values[2]);
  }

  if (count >= 7) {
    const cv::Quatd rotation(values[6], values[3], values[4], values[5]);
    const double norm = rotation.norm();
    if (std::isfinite(norm) && norm > 0.0) {
      pose.rotation = rotation / norm;
    }
  }

  return pose;
}

}  // namespace framesync::motion
