#include "framesync/io/frame_timestamps.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <opencv2/videoio.hpp>
#include <spdlog/spdlog.h>

namespace framesync::io {
namespace {

std::string Trim(std::string value) {
  const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (first >= last) {
    return {};
  }
  return std::string(first, last);
}

bool IsCommentOrEmpty(const std::string& line) {
  const std::string trimmed = Trim(line);
  return trimmed.empty() || trimmed.starts_with("#");
}

std::string FirstCsvField(const std::string& line) {
  std::stringstream stream(line);
  std::string field;
  std::getline(stream, field, ',');
  return Trim(field);
}

double ParseDouble(const std::string& value, std::size_t line_number, const std::filesystem::path& path) {
  try {
    return std::stod(value);
  } catch (const std::exception& ex) {
    throw std::runtime_error(
        fmt::format("Failed to parse timestamp on line {} of {}: {}", line_number, path.string(), ex.what()));
  }
}

}  // namespace

std::vector<double> LoadFrameTimestampsCsv(const std::filesystem::path& csv_path) {
  std::ifstream stream(csv_path);
  if (!stream.is_open()) {
    throw std::runtime_error(fmt::format("Could not open frame timestamp CSV: {}", csv_path.string()));
  }

  std::vector<double> timestamps;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(stream, line)) {
    ++line_number;
    if (IsCommentOrEmpty(line)) {
      continue;
    }

    const std::string field = FirstCsvField(line);
    if (field == "timestamp") {
      continue;
    }
    timestamps.push_back(ParseDouble(field, line_number, csv_path));
  }

  spdlog::info("Loaded {} frame timestamps from {}", timestamps.size(), csv_path.string());
  return timestamps;
}

VideoInfo ReadVideoInfo(const std::filesystem::path& video_path) {
  if (!std::filesystem::exists(video_path)) {
    throw std::runtime_error(fmt::format("Video file not found: {}", video_path.string()));
  }

  cv::VideoCapture capture(video_path.string());
  if (!capture.isOpened()) {
    throw std::runtime_error(fmt::format("Could not open video file: {}", video_path.string()));
  }

  VideoInfo info;
  info.fps = capture.get(cv::CAP_PROP_FPS);
  info.width = static_cast<int>(capture.get(cv::CAP_PROP_FRAME_WIDTH));
  info.height = static_cast<int>(capture.get(cv::CAP_PROP_FRAME_HEIGHT));

  const auto frame_count = static_cast<long long>(capture.get(cv::CAP_PROP_FRAME_COUNT));
  if (frame_count > 0) {
    info.frame_timestamps_s.reserve(static_cast<std::size_t>(frame_count));
  }

  // grab() advances without decoding into a Mat, enough for the position clock.
  while (capture.grab()) {
    info.frame_timestamps_s.push_back(capture.get(cv::CAP_PROP_POS_MSEC) / 1000.0);
  }

  spdlog::info(
      "Video {}: {}x{} at {:.2f} fps, {} frame timestamps",
      video_path.string(),
      info.width,
      info.height,
      info.fps,
      info.frame_timestamps_s.size());
  return info;
}

std::filesystem::path ResolveCompressedVideo(const std::filesystem::path& video_path) {
  auto compressed = video_path;
  compressed.replace_filename(video_path.stem().string() + "_compressed.mp4");
  if (std::filesystem::exists(compressed)) {
    spdlog::info("Using compressed video: {}", compressed.string());
    return compressed;
  }
  return video_path;
}

}  // namespace framesync::io
