#include "framesync/motion/motion_track.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#include <spdlog/spdlog.h>

namespace framesync::motion {
namespace {

std::size_t CommonLength(const RawTrajectory& trajectory) {
  std::size_t length = std::min(trajectory.timestamps.size(), trajectory.poses.size());
  for (const auto& [channel, poses] : trajectory.auxiliary_poses) {
    length = std::min(length, poses.size());
  }
  return length;
}

bool IsTruncated(const RawTrajectory& trajectory, std::size_t length) {
  if (trajectory.timestamps.size() != length || trajectory.poses.size() != length) {
    return true;
  }
  return std::any_of(trajectory.auxiliary_poses.begin(), trajectory.auxiliary_poses.end(), [length](const auto& entry) {
    return entry.second.size() != length;
  });
}

template <typename T>
std::vector<T> ApplyPermutation(const std::vector<T>& values, const std::vector<std::size_t>& order) {
  std::vector<T> permuted;
  permuted.reserve(order.size());
  for (const std::size_t index : order) {
    permuted.push_back(values[index]);
  }
  return permuted;
}

}  // namespace

MotionTrack MotionTrack::Build(const std::vector<MotionSource>& sources, TrackBuildReport* report) {
  MotionTrack track;
  TrackBuildReport local_report;

  for (const MotionSource& source : sources) {
    if (!source.trajectory) {
      spdlog::warn("Motion source {} has no trajectory data; skipping", source.name);
      ++local_report.sources_skipped;
      continue;
    }

    const RawTrajectory& trajectory = *source.trajectory;
    const std::size_t length = CommonLength(trajectory);
    if (IsTruncated(trajectory, length)) {
      spdlog::warn(
          "Motion source {}: {} timestamps vs {} poses; truncating to {}",
          source.name,
          trajectory.timestamps.size(),
          trajectory.poses.size(),
          length);
      ++local_report.sources_truncated;
    }

    if (length == 0) {
      spdlog::warn("Motion source {} contributes no samples; skipping", source.name);
      ++local_report.sources_skipped;
      continue;
    }

    const std::size_t offset = track.timestamps_.size();
    for (std::size_t i = 0; i < length; ++i) {
      track.timestamps_.push_back(trajectory.timestamps[i]);
      const auto& values = trajectory.poses[i];
      track.poses_.push_back(PoseFromArray(values.data(), values.size()));
    }

    for (const auto& [channel, poses] : trajectory.auxiliary_poses) {
      auto& target = track.auxiliary_[channel];
      target.resize(offset);
      for (std::size_t i = 0; i < length; ++i) {
        target.push_back(PoseFromArray(poses[i].data(), poses[i].size()));
      }
    }
    for (auto& [channel, poses] : track.auxiliary_) {
      poses.resize(track.timestamps_.size());
    }

    spdlog::debug("Motion source {}: {} samples", source.name, length);
    ++local_report.sources_loaded;
  }

  // Every parallel array is reordered with the same permutation so the pairing
  // between primary and auxiliary poses survives the merge.
  std::vector<std::size_t> order(track.timestamps_.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&track](std::size_t lhs, std::size_t rhs) {
    return track.timestamps_[lhs] < track.timestamps_[rhs];
  });

  track.timestamps_ = ApplyPermutation(track.timestamps_, order);
  track.poses_ = ApplyPermutation(track.poses_, order);
  for (auto& [channel, poses] : track.auxiliary_) {
    poses = ApplyPermutation(poses, order);
  }

  local_report.total_samples = track.timestamps_.size();
  spdlog::info(
      "Motion track built from {} sources ({} skipped, {} truncated): {} samples",
      local_report.sources_loaded,
      local_report.sources_skipped,
      local_report.sources_truncated,
      local_report.total_samples);

  if (report != nullptr) {
    *report = local_report;
  }
  return track;
}

std::size_t MotionTrack::size() const {
  return timestamps_.size();
}

bool MotionTrack::empty() const {
  return timestamps_.empty();
}

std::optional<std::pair<double, double>> MotionTrack::TimeRange() const {
  if (timestamps_.empty()) {
    return std::nullopt;
  }
  return std::make_pair(timestamps_.front(), timestamps_.back());
}

std::optional<TrackSample> MotionTrack::Nearest(double timestamp, std::optional<double> tolerance) const {
  if (timestamps_.empty()) {
    return std::nullopt;
  }

  const auto it = std::lower_bound(timestamps_.begin(), timestamps_.end(), timestamp);
  const auto insertion = static_cast<std::size_t>(std::distance(timestamps_.begin(), it));

  std::size_t best_index = 0;
  double best_distance = std::numeric_limits<double>::infinity();
  if (insertion < timestamps_.size()) {
    best_index = insertion;
    best_distance = std::abs(timestamps_[insertion] - timestamp);
  }
  if (insertion > 0) {
    const double distance = std::abs(timestamps_[insertion - 1] - timestamp);
    if (distance < best_distance) {
      best_index = insertion - 1;
      best_distance = distance;
    }
  }

  if (tolerance && best_distance > *tolerance) {
    return std::nullopt;
  }
  return SampleAt(best_index);
}

Bracket MotionTrack::BracketAt(double timestamp) const {
  Bracket bracket;
  if (timestamps_.empty()) {
    return bracket;
  }

  const auto it = std::lower_bound(timestamps_.begin(), timestamps_.end(), timestamp);
  const auto insertion = static_cast<std::size_t>(std::distance(timestamps_.begin(), it));

  if (insertion < timestamps_.size() && timestamps_[insertion] == timestamp) {
    bracket.prev = SampleAt(insertion);
    bracket.next = bracket.prev;
    return bracket;
  }

  if (insertion < timestamps_.size()) {
    bracket.next = SampleAt(insertion);
  }
  if (insertion > 0) {
    bracket.prev = SampleAt(insertion - 1);
  }
  return bracket;
}

TrackSample MotionTrack::SampleAt(std::size_t index) const {
  return TrackSample{index, timestamps_.at(index), poses_.at(index)};
}

std::optional<Pose> MotionTrack::Auxiliary(std::string_view channel, std::size_t index) const {
  const auto it = auxiliary_.find(channel);
  if (it == auxiliary_.end() || index >= it->second.size()) {
    return std::nullopt;
  }
  return it->second[index];
}

std::vector<std::string> MotionTrack::AuxiliaryChannels() const {
  std::vector<std::string> channels;
  channels.reserve(auxiliary_.size());
  for (const auto& [channel, poses] : auxiliary_) {
    channels.push_back(channel);
  }
  return channels;
}

const std::vector<double>& MotionTrack::timestamps() const {
  return timestamps_;
}

}  // namespace framesync::motion
