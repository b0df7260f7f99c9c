#pragma once

#include <optional>

#include "framesync/motion/pose.hpp"

namespace framesync::motion {

// Lerp on position and gripper, shortest-arc slerp on rotation. Weight is clamped
// to [0, 1].
Pose Interpolate(const Pose& a, const Pose& b, double weight);

// Empty unless both endpoints carry a pose.
std::optional<Pose> Interpolate(const std::optional<Pose>& a, const std::optional<Pose>& b, double weight);

}  // namespace framesync::motion
