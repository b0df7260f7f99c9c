#include "framesync/motion/pose_interpolator.hpp"

#include <algorithm>
#include <cmath>

namespace framesync::motion {
namespace {

cv::Quatd NormalizedOrIdentity(const cv::Quatd& rotation) {
  const double norm = rotation.norm();
  if (!std::isfinite(norm) || norm <= 0.0) {
    return cv::Quatd(1.0, 0.0, 0.0, 0.0);
  }
  return rotation / norm;
}

}  // namespace

Pose Interpolate(const Pose& a, const Pose& b, double weight) {
  const double t = std::clamp(weight, 0.0, 1.0);

  Pose result;
  result.position = a.position + (b.position - a.position) * t;
  result.gripper = a.gripper + (b.gripper - a.gripper) * t;

  const cv::Quatd from = NormalizedOrIdentity(a.rotation);
  const cv::Quatd to = NormalizedOrIdentity(b.rotation);
  // Endpoints keep the caller's sign; only the interior takes the shortest arc.
  if (t <= 0.0) {
    result.rotation = from;
    return result;
  }
  if (t >= 1.0) {
    result.rotation = to;
    return result;
  }

  const cv::Quatd target = from.dot(to) < 0.0 ? -to : to;
  result.rotation = NormalizedOrIdentity(cv::Quatd::slerp(from, target, t, cv::QUAT_ASSUME_UNIT, true));
  return result;
}

std::optional<Pose> Interpolate(const std::optional<Pose>& a, const std::optional<Pose>& b, double weight) {
  if (!a || !b) {
    return std::nullopt;
  }
  return Interpolate(*a, *b, weight);
}

}  // namespace framesync::motion
