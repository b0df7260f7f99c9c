#pragma once

#include <filesystem>
#include <vector>

#include "framesync/motion/motion_track.hpp"

namespace framesync::motion {

// Reads the first trajectory of a JSON motion record. Unreadable or malformed
// records come back without a trajectory.
MotionSource LoadMotionSource(const std::filesystem::path& path);

// Accepts a single record or a directory of records. Directory entries are read
// in filename order; *metadata.json and *validation.json are ignored.
std::vector<MotionSource> LoadMotionSources(const std::filesystem::path& path);

}  // namespace framesync::motion
