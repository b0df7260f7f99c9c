#include <cmath>
#include <filesystem>
#include <limits>
#include <stdexcept>

#include <gtest/gtest.h>
#include <opencv2/core/quaternion.hpp>

#include "framesync/motion/pose.hpp"
#include "framesync/projection/calibrated_projector.hpp"
#include "framesync/projection/calibration.hpp"

namespace {

using framesync::motion::Pose;
using framesync::projection::CalibratedProjector;
using framesync::projection::CalibrationTransform;
using framesync::projection::ProjectionSnapshot;

constexpr int kWidth = 1280;
constexpr int kHeight = 720;

CalibrationTransform WithFieldOfView(double fov_deg) {
  CalibrationTransform calibration;
  calibration.field_of_view_deg = fov_deg;
  return calibration;
}

cv::Quatd AxisAngle(double angle_deg, const cv::Vec3d& axis) {
  return cv::Quatd::createFromAngleAxis(angle_deg * CV_PI / 180.0, axis);
}

}  // namespace

TEST(CalibratedProjectorTest, PointOnOpticalAxisHitsImageCentre) {
  const ProjectionSnapshot snapshot(WithFieldOfView(90.0), kWidth, kHeight);

  const auto pixel = snapshot.Project(cv::Vec3d(0.0, 0.0, 2.0), Pose{}, true);
  ASSERT_TRUE(pixel.has_value());
  EXPECT_NEAR(pixel->x, 640.0, 1e-9);
  EXPECT_NEAR(pixel->y, 360.0, 1e-9);
}

TEST(CalibratedProjectorTest, UpInTrackingSpaceIsUpInImage) {
  const ProjectionSnapshot snapshot(WithFieldOfView(90.0), kWidth, kHeight);

  const auto pixel = snapshot.Project(cv::Vec3d(0.5, 0.5, 2.0), Pose{}, true);
  ASSERT_TRUE(pixel.has_value());
  EXPECT_NEAR(pixel->x, 800.0, 1e-9);
  EXPECT_NEAR(pixel->y, 200.0, 1e-9);
}

TEST(CalibratedProjectorTest, RejectsPointsBehindOrAtCamera) {
  const ProjectionSnapshot snapshot(WithFieldOfView(90.0), kWidth, kHeight);

  EXPECT_FALSE(snapshot.Project(cv::Vec3d(0.0, 0.0, 0.0), Pose{}, false).has_value());
  EXPECT_FALSE(snapshot.Project(cv::Vec3d(0.0, 0.0, -1.0), Pose{}, false).has_value());
  EXPECT_FALSE(snapshot.Project(cv::Vec3d(0.1, 0.1, 0.05), Pose{}, false).has_value());

  Pose camera;
  camera.position = cv::Vec3d(0.0, 0.0, 5.0);
  EXPECT_FALSE(snapshot.Project(cv::Vec3d(0.0, 0.0, 2.0), camera, false).has_value());
}

TEST(CalibratedProjectorTest, BoundsCheckIsOptional) {
  const ProjectionSnapshot snapshot(WithFieldOfView(90.0), kWidth, kHeight);
  const cv::Vec3d far_right(10.0, 0.0, 1.0);

  EXPECT_FALSE(snapshot.Project(far_right, Pose{}, true).has_value());
  const auto unchecked = snapshot.Project(far_right, Pose{}, false);
  ASSERT_TRUE(unchecked.has_value());
  EXPECT_NEAR(unchecked->x, 640.0 * 10.0 + 640.0, 1e-6);
}

TEST(CalibratedProjectorTest, BoundsCheckRejectsNonFinitePixels) {
  const ProjectionSnapshot snapshot(WithFieldOfView(90.0), kWidth, kHeight);
  const double nan = std::numeric_limits<double>::quiet_NaN();

  EXPECT_FALSE(snapshot.Project(cv::Vec3d(nan, 0.0, 2.0), Pose{}, true).has_value());

  Pose camera;
  camera.position = cv::Vec3d(0.0, nan, 0.0);
  EXPECT_FALSE(snapshot.Project(cv::Vec3d(0.0, 0.0, 2.0), camera, true).has_value());
}

TEST(CalibratedProjectorTest, UsesCameraPoseToReachLocalFrame) {
  const ProjectionSnapshot snapshot(WithFieldOfView(90.0), kWidth, kHeight);

  Pose camera;
  camera.position = cv::Vec3d(1.0, 0.0, 0.0);
  camera.rotation = AxisAngle(90.0, cv::Vec3d(0.0, 1.0, 0.0));

  const auto pixel = snapshot.Project(cv::Vec3d(3.0, 0.0, 0.0), camera, true);
  ASSERT_TRUE(pixel.has_value());
  EXPECT_NEAR(pixel->x, 640.0, 1e-9);
  EXPECT_NEAR(pixel->y, 360.0, 1e-9);

  EXPECT_FALSE(snapshot.Project(cv::Vec3d(-3.0, 0.0, 0.0), camera, true).has_value());
}

TEST(CalibratedProjectorTest, CalibrationTranslatesAndPreMultipliesRotation) {
  CalibrationTransform calibration;
  calibration.position_offset = cv::Vec3d(0.1, -0.2, 0.3);
  calibration.rotation_offset_euler_deg = cv::Vec3d(0.0, 0.0, 90.0);
  const ProjectionSnapshot snapshot(calibration, kWidth, kHeight);

  Pose pose;
  pose.position = cv::Vec3d(1.0, 1.0, 1.0);
  pose.rotation = AxisAngle(90.0, cv::Vec3d(1.0, 0.0, 0.0));
  pose.gripper = 0.4;

  const Pose calibrated = snapshot.ApplyCalibration(pose);
  EXPECT_NEAR(calibrated.position[0], 1.1, 1e-12);
  EXPECT_NEAR(calibrated.position[1], 0.8, 1e-12);
  EXPECT_NEAR(calibrated.position[2], 1.3, 1e-12);
  EXPECT_DOUBLE_EQ(calibrated.gripper, 0.4);

  const cv::Quatd world_first = AxisAngle(90.0, cv::Vec3d(0.0, 0.0, 1.0)) * pose.rotation;
  const cv::Quatd local_first = pose.rotation * AxisAngle(90.0, cv::Vec3d(0.0, 0.0, 1.0));
  EXPECT_NEAR(std::abs(calibrated.rotation.dot(world_first)), 1.0, 1e-9);
  EXPECT_LT(std::abs(calibrated.rotation.dot(local_first)), 0.99);
}

TEST(CalibratedProjectorTest, IntrinsicsFollowFieldOfView) {
  CalibratedProjector projector(kWidth, kHeight, WithFieldOfView(90.0));
  EXPECT_NEAR(projector.Snapshot()->intrinsics().focal_length, 640.0, 1e-9);

  EXPECT_TRUE(projector.SetCalibration(WithFieldOfView(60.0)));
  EXPECT_NEAR(projector.Snapshot()->intrinsics().focal_length, 640.0 / std::tan(CV_PI / 6.0), 1e-9);
  EXPECT_DOUBLE_EQ(projector.calibration().field_of_view_deg, 60.0);
}

TEST(CalibratedProjectorTest, RejectsFieldOfViewOutsideOpenRange) {
  EXPECT_THROW(ProjectionSnapshot(WithFieldOfView(0.0), kWidth, kHeight), std::invalid_argument);
  EXPECT_THROW(CalibratedProjector(kWidth, kHeight, WithFieldOfView(180.0)), std::invalid_argument);

  CalibratedProjector projector(kWidth, kHeight, WithFieldOfView(90.0));
  EXPECT_FALSE(projector.SetCalibration(WithFieldOfView(0.0)));
  EXPECT_FALSE(projector.SetCalibration(WithFieldOfView(-45.0)));
  EXPECT_FALSE(projector.SetCalibration(WithFieldOfView(180.0)));
  EXPECT_FALSE(projector.SetCalibration(WithFieldOfView(std::numeric_limits<double>::quiet_NaN())));

  EXPECT_DOUBLE_EQ(projector.calibration().field_of_view_deg, 90.0);
  EXPECT_NEAR(projector.Snapshot()->intrinsics().focal_length, 640.0, 1e-9);
  const auto pixel = projector.Snapshot()->Project(cv::Vec3d(0.0, 0.0, 2.0), Pose{}, true);
  ASSERT_TRUE(pixel.has_value());
  EXPECT_NEAR(pixel->x, 640.0, 1e-9);
}

TEST(CalibratedProjectorTest, SnapshotsAreUnaffectedBySetCalibration) {
  CalibratedProjector projector(kWidth, kHeight, WithFieldOfView(90.0));
  const auto before = projector.Snapshot();

  CalibrationTransform adjusted = WithFieldOfView(50.0);
  adjusted.position_offset = cv::Vec3d(0.0, 0.0, 1.0);
  ASSERT_TRUE(projector.SetCalibration(adjusted));

  EXPECT_DOUBLE_EQ(before->calibration().field_of_view_deg, 90.0);
  EXPECT_EQ(before->calibration().position_offset, cv::Vec3d(0.0, 0.0, 0.0));
  EXPECT_DOUBLE_EQ(projector.Snapshot()->calibration().field_of_view_deg, 50.0);
}

TEST(CalibratedProjectorTest, FromFileLoadsStoredCalibrationOrDefaults) {
  const auto dir = std::filesystem::temp_directory_path() / "framesync_tests" / "projector_from_file";
  std::filesystem::remove_all(dir);
  const auto path = dir / "calibration.json";

  const auto defaulted = CalibratedProjector::FromFile(path, kWidth, kHeight);
  EXPECT_DOUBLE_EQ(defaulted.calibration().field_of_view_deg, framesync::projection::kDefaultFieldOfViewDeg);

  CalibratedProjector projector(kWidth, kHeight, WithFieldOfView(75.0));
  projector.Save(path);

  const auto restored = CalibratedProjector::FromFile(path, kWidth, kHeight);
  EXPECT_DOUBLE_EQ(restored.calibration().field_of_view_deg, 75.0);
  EXPECT_EQ(restored.width(), kWidth);
  EXPECT_EQ(restored.height(), kHeight);

  CalibratedProjector reloaded(kWidth, kHeight);
  ASSERT_TRUE(reloaded.Load(path));
  EXPECT_DOUBLE_EQ(reloaded.calibration().field_of_view_deg, 75.0);
}
