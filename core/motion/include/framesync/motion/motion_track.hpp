#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "framesync/motion/pose.hpp"

namespace framesync::motion {

inline constexpr std::string_view kLeftEyeChannel = "left_eye";
inline constexpr std::string_view kRightEyeChannel = "right_eye";

// One trajectory as read from a source record, before any validation. Every pose
// entry is a [px, py, pz, qx, qy, qz, qw] array, possibly shorter.
struct RawTrajectory {
  std::vector<double> timestamps;
  std::vector<std::vector<double>> poses;
  std::map<std::string, std::vector<std::vector<double>>, std::less<>> auxiliary_poses;
};

struct MotionSource {
  std::string name;
  std::optional<RawTrajectory> trajectory;
};

struct TrackBuildReport {
  std::size_t sources_loaded = 0;
  std::size_t sources_skipped = 0;
  std::size_t sources_truncated = 0;
  std::size_t total_samples = 0;
};

struct TrackSample {
  std::size_t index = 0;
  double timestamp = 0.0;
  Pose pose;
};

struct Bracket {
  std::optional<TrackSample> prev;
  std::optional<TrackSample> next;

  // Zero-width bracket: the query hit a sample timestamp exactly or was clamped.
  bool degenerate() const { return prev && next && prev->index == next->index; }
};

class MotionTrack {
 public:
  MotionTrack() = default;

  static MotionTrack Build(const std::vector<MotionSource>& sources, TrackBuildReport* report = nullptr);

  std::size_t size() const;
  bool empty() const;

  std::optional<std::pair<double, double>> TimeRange() const;
  std::optional<TrackSample> Nearest(double timestamp, std::optional<double> tolerance = std::nullopt) const;
  Bracket BracketAt(double timestamp) const;

  TrackSample SampleAt(std::size_t index) const;
  std::optional<Pose> Auxiliary(std::string_view channel, std::size_t index) const;
  std::vector<std::string> AuxiliaryChannels() const;

  const std::vector<double>& timestamps() const;

 private:
  std::vector<double> timestamps_;
  std::vector<Pose> poses_;
  std::map<std::string, std::vector<std::optional<Pose>>, std::less<>> auxiliary_;
};

}  // namespace framesync::motion
