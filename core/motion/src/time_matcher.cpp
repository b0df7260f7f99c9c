#include "framesync/motion/time_matcher.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace framesync::motion {
namespace {

constexpr double kMinBracketWidth = 1e-9;

}  // namespace

TimeMatcher::TimeMatcher(const MotionTrack& track) : track_(track) {}

FrameMatch TimeMatcher::Match(double timestamp, double offset, double gap_threshold) const {
  FrameMatch match;
  match.raw_ts = timestamp;
  match.aligned_ts = timestamp + offset;

  const Bracket bracket = track_.BracketAt(match.aligned_ts);
  if (!bracket.prev && !bracket.next) {
    return match;
  }

  if (!bracket.prev) {
    match.prev_index = bracket.next->index;
    match.next_index = bracket.next->index;
    match.prev_ts = bracket.next->timestamp;
    match.next_ts = bracket.next->timestamp;
    match.weight = 0.0;
    return match;
  }

  if (!bracket.next) {
    match.prev_index = bracket.prev->index;
    match.next_index = bracket.prev->index;
    match.prev_ts = bracket.prev->timestamp;
    match.next_ts = bracket.prev->timestamp;
    match.weight = 1.0;
    return match;
  }

  match.prev_index = bracket.prev->index;
  match.next_index = bracket.next->index;
  match.prev_ts = bracket.prev->timestamp;
  match.next_ts = bracket.next->timestamp;

  const double width = bracket.next->timestamp - bracket.prev->timestamp;
  if (width > kMinBracketWidth) {
    match.weight = std::clamp((match.aligned_ts - bracket.prev->timestamp) / width, 0.0, 1.0);
  } else {
    match.weight = 0.0;
  }
  match.gapped = width > gap_threshold;
  return match;
}

std::vector<FrameMatch> TimeMatcher::Align(const std::vector<double>& external_timestamps,
                                           double offset,
                                           double gap_threshold) const {
  if (track_.empty()) {
    spdlog::warn("No motion samples available; {} timestamps left unmatched", external_timestamps.size());
  }

  std::vector<FrameMatch> matches;
  matches.reserve(external_timestamps.size());
  for (const double timestamp : external_timestamps) {
    matches.push_back(Match(timestamp, offset, gap_threshold));
  }
  return matches;
}

}  // namespace framesync::motion
