#include "framesync/projection/calibration.hpp"

#include <cmath>
#include <exception>
#include <fstream>
#include <memory>
#include <stdexcept>

#include <fmt/format.h>
#include <json/json.h>

namespace framesync::projection {
namespace {

cv::Vec3d ReadVec3(const Json::Value& value, const cv::Vec3d& fallback) {
  if (!value.isArray() || value.size() < 3) {
    return fallback;
  }
  return cv::Vec3d(value[0].asDouble(), value[1].asDouble(), value[2].asDouble());
}

Json::Value WriteVec3(const cv::Vec3d& vec) {
  Json::Value array(Json::arrayValue);
  array.append(vec[0]);
  array.append(vec[1]);
  array.append(vec[2]);
  return array;
}

}  // namespace

bool IsValidFieldOfView(double field_of_view_deg) {
  return field_of_view_deg > 0.0 && field_of_view_deg < 180.0;
}

CameraIntrinsics CameraIntrinsics::FromFieldOfView(int width, int height, double field_of_view_deg) {
  CameraIntrinsics intrinsics;
  intrinsics.width = width;
  intrinsics.height = height;
  const double half_fov_rad = field_of_view_deg * CV_PI / 360.0;
  intrinsics.focal_length = (static_cast<double>(width) / 2.0) / std::tan(half_fov_rad);
  intrinsics.cx = static_cast<double>(width) / 2.0;
  intrinsics.cy = static_cast<double>(height) / 2.0;
  return intrinsics;
}

cv::Matx33d CameraIntrinsics::CameraMatrix() const {
  return cv::Matx33d(focal_length, 0.0, cx, 0.0, focal_length, cy, 0.0, 0.0, 1.0);
}

std::optional<CalibrationTransform> LoadCalibration(const std::filesystem::path& path, std::string* error_message) {
  try {
    if (!std::filesystem::exists(path)) {
      if (error_message != nullptr) {
        *error_message = fmt::format("Calibration file not found: {}", path.string());
      }
      return std::nullopt;
    }

    std::ifstream stream(path);
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!stream.is_open() || !Json::parseFromStream(builder, stream, &root, &errors) || !root.isObject()) {
      if (error_message != nullptr) {
        *error_message = fmt::format("Invalid calibration file {}: {}", path.string(), errors);
      }
      return std::nullopt;
    }

    CalibrationTransform calibration;
    calibration.position_offset = ReadVec3(root["offset_pos"], calibration.position_offset);
    calibration.rotation_offset_euler_deg = ReadVec3(root["offset_rot_euler"], calibration.rotation_offset_euler_deg);
    if (root["fov"].isNumeric()) {
      calibration.field_of_view_deg = root["fov"].asDouble();
    }
    if (!IsValidFieldOfView(calibration.field_of_view_deg)) {
      if (error_message != nullptr) {
        *error_message = fmt::format("Invalid field of view {} in calibration file {}",
                                     calibration.field_of_view_deg, path.string());
      }
      return std::nullopt;
    }
    return calibration;
  } catch (const std::exception& ex) {
    if (error_message != nullptr) {
      *error_message = std::string("Failed to load calibration: ") + ex.what();
    }
    return std::nullopt;
  }
}

void SaveCalibration(const std::filesystem::path& path, const CalibrationTransform& calibration) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  std::ofstream stream(path, std::ios::trunc);
  if (!stream.is_open()) {
    throw std::runtime_error(fmt::format("Could not write calibration file: {}", path.string()));
  }

  Json::Value root(Json::objectValue);
  root["offset_pos"] = WriteVec3(calibration.position_offset);
  root["offset_rot_euler"] = WriteVec3(calibration.rotation_offset_euler_deg);
  root["fov"] = calibration.field_of_view_deg;

  Json::StreamWriterBuilder writer;
  writer["indentation"] = "  ";
  const std::unique_ptr<Json::StreamWriter> json_writer(writer.newStreamWriter());
  json_writer->write(root, &stream);
  stream << '\n';
}

}  // namespace framesync::projection
