#include <cmath>
#include <optional>

#include <gtest/gtest.h>
#include <opencv2/core/quaternion.hpp>

#include "framesync/motion/pose.hpp"
#include "framesync/motion/pose_interpolator.hpp"

namespace {

using framesync::motion::Interpolate;
using framesync::motion::Pose;

constexpr double kTolerance = 1e-9;

Pose MakePose(const cv::Vec3d& position, double angle_deg, const cv::Vec3d& axis, double gripper = 0.0) {
  Pose pose;
  pose.position = position;
  pose.rotation = cv::Quatd::createFromAngleAxis(angle_deg * CV_PI / 180.0, axis);
  pose.gripper = gripper;
  return pose;
}

void ExpectPoseNear(const Pose& actual, const Pose& expected) {
  for (int i = 0; i < 3; ++i) {
    EXPECT_NEAR(actual.position[i], expected.position[i], kTolerance);
  }
  EXPECT_NEAR(actual.rotation.w, expected.rotation.w, kTolerance);
  EXPECT_NEAR(actual.rotation.x, expected.rotation.x, kTolerance);
  EXPECT_NEAR(actual.rotation.y, expected.rotation.y, kTolerance);
  EXPECT_NEAR(actual.rotation.z, expected.rotation.z, kTolerance);
  EXPECT_NEAR(actual.gripper, expected.gripper, kTolerance);
}

}  // namespace

TEST(PoseInterpolatorTest, EndpointsReproduceInputs) {
  const Pose a = MakePose({0.0, 1.0, 2.0}, 10.0, {0.0, 1.0, 0.0}, 0.2);
  const Pose b = MakePose({4.0, -1.0, 0.5}, 70.0, {1.0, 0.0, 0.0}, 0.8);

  ExpectPoseNear(Interpolate(a, b, 0.0), a);
  ExpectPoseNear(Interpolate(a, b, 1.0), b);
}

TEST(PoseInterpolatorTest, LerpsPositionAndGripper) {
  const Pose a = MakePose({0.0, 0.0, 0.0}, 0.0, {0.0, 0.0, 1.0}, 0.0);
  const Pose b = MakePose({2.0, 4.0, -6.0}, 0.0, {0.0, 0.0, 1.0}, 1.0);

  const Pose mid = Interpolate(a, b, 0.25);
  EXPECT_NEAR(mid.position[0], 0.5, kTolerance);
  EXPECT_NEAR(mid.position[1], 1.0, kTolerance);
  EXPECT_NEAR(mid.position[2], -1.5, kTolerance);
  EXPECT_NEAR(mid.gripper, 0.25, kTolerance);
}

TEST(PoseInterpolatorTest, SlerpsHalfwayAboutFixedAxis) {
  const cv::Vec3d axis(0.0, 0.0, 1.0);
  const Pose a = MakePose({0.0, 0.0, 0.0}, 0.0, axis);
  const Pose b = MakePose({0.0, 0.0, 0.0}, 90.0, axis);

  const Pose mid = Interpolate(a, b, 0.5);
  const Pose expected = MakePose({0.0, 0.0, 0.0}, 45.0, axis);
  ExpectPoseNear(mid, expected);
  EXPECT_NEAR(mid.rotation.norm(), 1.0, kTolerance);
}

TEST(PoseInterpolatorTest, TakesShortestArcForOppositeSignQuaternions) {
  const cv::Vec3d axis(0.0, 1.0, 0.0);
  const Pose a = MakePose({0.0, 0.0, 0.0}, 0.0, axis);
  Pose b = MakePose({0.0, 0.0, 0.0}, 60.0, axis);
  b.rotation = -b.rotation;

  const Pose mid = Interpolate(a, b, 0.5);
  const cv::Quatd expected = cv::Quatd::createFromAngleAxis(30.0 * CV_PI / 180.0, axis);
  EXPECT_NEAR(std::abs(mid.rotation.dot(expected)), 1.0, kTolerance);
}

TEST(PoseInterpolatorTest, EndpointsKeepSignOfOppositeHemisphereQuaternion) {
  const cv::Vec3d axis(0.0, 1.0, 0.0);
  const Pose a = MakePose({0.0, 0.0, 0.0}, 0.0, axis);
  Pose b = MakePose({1.0, 0.0, 0.0}, 60.0, axis, 1.0);
  b.rotation = -b.rotation;
  ASSERT_LT(a.rotation.dot(b.rotation), 0.0);

  ExpectPoseNear(Interpolate(a, b, 0.0), a);
  ExpectPoseNear(Interpolate(a, b, 1.0), b);
  ExpectPoseNear(Interpolate(b, a, 0.0), b);
  ExpectPoseNear(Interpolate(b, a, 1.0), a);
}

TEST(PoseInterpolatorTest, ClampsWeightOutsideUnitInterval) {
  const Pose a = MakePose({0.0, 0.0, 0.0}, 0.0, {0.0, 0.0, 1.0});
  const Pose b = MakePose({1.0, 0.0, 0.0}, 40.0, {0.0, 0.0, 1.0});

  ExpectPoseNear(Interpolate(a, b, -0.5), a);
  ExpectPoseNear(Interpolate(a, b, 1.5), b);
}

TEST(PoseInterpolatorTest, IsDeterministic) {
  const Pose a = MakePose({0.3, 0.1, -0.2}, 12.0, {1.0, 1.0, 0.0});
  const Pose b = MakePose({0.4, 0.0, -0.1}, 33.0, {0.0, 1.0, 1.0});

  const Pose first = Interpolate(a, b, 0.37);
  Interpolate(b, a, 0.81);
  const Pose second = Interpolate(a, b, 0.37);

  EXPECT_EQ(first.position, second.position);
  EXPECT_EQ(first.rotation, second.rotation);
  EXPECT_EQ(first.gripper, second.gripper);
}

TEST(PoseInterpolatorTest, OptionalPosesNeedBothEndpoints) {
  const Pose a = MakePose({0.0, 0.0, 0.0}, 0.0, {0.0, 0.0, 1.0});
  const Pose b = MakePose({2.0, 0.0, 0.0}, 0.0, {0.0, 0.0, 1.0});

  EXPECT_FALSE(Interpolate(std::optional<Pose>(a), std::nullopt, 0.5).has_value());
  EXPECT_FALSE(Interpolate(std::nullopt, std::optional<Pose>(b), 0.5).has_value());

  const auto mid = Interpolate(std::optional<Pose>(a), std::optional<Pose>(b), 0.5);
  ASSERT_TRUE(mid.has_value());
  EXPECT_NEAR(mid->position[0], 1.0, kTolerance);
}
