#pragma once

#include <string>

#include <opencv2/core.hpp>

#include "framesync/motion/pose.hpp"
#include "framesync/projection/calibrated_projector.hpp"

namespace framesync::projection {

// Draws the pose axes (x red, y green, z blue) with a yellow centre. Returns
// false when the pose origin does not project into the image.
bool DrawPoseGizmo(cv::Mat& image,
                   const ProjectionSnapshot& snapshot,
                   const motion::Pose& pose,
                   const motion::Pose& camera_pose,
                   double axis_length = 0.1);

bool DrawHandPoint(cv::Mat& image,
                   const ProjectionSnapshot& snapshot,
                   const motion::Pose& pose,
                   const motion::Pose& camera_pose,
                   const cv::Scalar& color,
                   const std::string& label = {});

}  // namespace framesync::projection
