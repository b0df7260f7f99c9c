#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "framesync/motion/motion_track.hpp"

namespace framesync::motion {

struct FrameMatch {
  double raw_ts = 0.0;
  double aligned_ts = 0.0;
  std::optional<double> prev_ts;
  std::optional<double> next_ts;
  std::optional<std::size_t> prev_index;
  std::optional<std::size_t> next_index;
  double weight = 0.0;
  bool gapped = false;

  bool has_bracket() const { return prev_index.has_value() && next_index.has_value(); }
};

// Maps a foreign clock onto the track clock. Outside the recorded interval the
// match clamps to the first or last sample instead of extrapolating.
class TimeMatcher {
 public:
  // Holds a reference to the track, which must outlive the matcher.
  explicit TimeMatcher(const MotionTrack& track);
  explicit TimeMatcher(MotionTrack&&) = delete;

  FrameMatch Match(double timestamp, double offset, double gap_threshold) const;
  std::vector<FrameMatch> Align(const std::vector<double>& external_timestamps,
                                double offset,
                                double gap_threshold) const;

 private:
  const MotionTrack& track_;
};

}  // namespace framesync::motion
