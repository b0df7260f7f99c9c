#pragma once

#include <filesystem>
#include <vector>

namespace framesync::io {

struct VideoInfo {
  double fps = 0.0;
  int width = 0;
  int height = 0;
  std::vector<double> frame_timestamps_s;
};

// First column is the frame timestamp in seconds.
std::vector<double> LoadFrameTimestampsCsv(const std::filesystem::path& csv_path);

VideoInfo ReadVideoInfo(const std::filesystem::path& video_path);

std::filesystem::path ResolveCompressedVideo(const std::filesystem::path& video_path);

}  // namespace framesync::io
