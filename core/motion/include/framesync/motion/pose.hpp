#pragma once

#include <cstddef>

#include <opencv2/core.hpp>
#include <opencv2/core/quaternion.hpp>

namespace framesync::motion {

struct Pose {
  cv::Vec3d position{0.0, 0.0, 0.0};
  cv::Quatd rotation{1.0, 0.0, 0.0, 0.0};
  double gripper = 0.0;
};

// Builds a pose from [px, py, pz, qx, qy, qz, qw]. Arrays shorter than 3 keep the
// origin, arrays shorter than 7 keep the identity rotation.
Pose PoseFromArray(const double* values, std::size_t count);

}  // namespace framesync::motion
