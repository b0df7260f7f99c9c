#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "framesync/sync/frame_synchronizer.hpp"

namespace framesync::sync {

struct SyncedExportMetadata {
  std::string video_path;
  std::vector<std::string> motion_sources;
  double fps = 0.0;
  double timestamp_offset = 0.0;
  double gap_threshold = kDefaultGapThreshold;
};

void WriteSyncedPoses(const std::filesystem::path& path,
                      const std::vector<SyncedFrame>& frames,
                      const SyncedExportMetadata& metadata);

}  // namespace framesync::sync
