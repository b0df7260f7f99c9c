#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <opencv2/core.hpp>
#include <opencv2/core/utility.hpp>
#include <opencv2/videoio.hpp>
#include <spdlog/spdlog.h>

#include "framesync/common/version.hpp"
#include "framesync/io/frame_timestamps.hpp"
#include "framesync/io/session_config.hpp"
#include "framesync/motion/motion_source.hpp"
#include "framesync/motion/motion_track.hpp"
#include "framesync/motion/time_matcher.hpp"
#include "framesync/projection/calibrated_projector.hpp"
#include "framesync/projection/overlay.hpp"
#include "framesync/sync/frame_synchronizer.hpp"
#include "framesync/sync/synced_export.hpp"

namespace {

const cv::Scalar kRawColor(128, 0, 128);
const cv::Scalar kSyncedColor(0, 255, 255);

// The raw sample is the bracket end the synced timestamp sits closer to.
std::optional<framesync::motion::Pose> NearestRawPose(const framesync::motion::MotionTrack& track,
                                                      const framesync::motion::FrameMatch& match) {
  if (!match.has_bracket()) {
    return std::nullopt;
  }
  const std::size_t index = match.weight < 0.5 ? *match.prev_index : *match.next_index;
  return track.SampleAt(index).pose;
}

bool DrawFrameOverlay(cv::Mat& image,
                      framesync::io::OverlayStyle style,
                      const framesync::motion::MotionTrack& track,
                      const framesync::sync::SyncedFrame& frame,
                      const framesync::projection::ProjectionSnapshot& snapshot) {
  if (!frame.hand_pose || !frame.camera_pose) {
    return false;
  }
  const auto camera = snapshot.ApplyCalibration(*frame.camera_pose);
  if (style == framesync::io::OverlayStyle::kGizmo) {
    return framesync::projection::DrawPoseGizmo(image, snapshot, *frame.hand_pose, camera);
  }

  if (const auto raw = NearestRawPose(track, frame.match)) {
    framesync::projection::DrawHandPoint(image, snapshot, *raw, camera, kRawColor, "RAW");
  }
  return framesync::projection::DrawHandPoint(image, snapshot, *frame.hand_pose, camera, kSyncedColor, "SYNCED");
}

void RenderOverlayVideo(const std::filesystem::path& video_path,
                        const std::filesystem::path& output_path,
                        framesync::io::OverlayStyle style,
                        const framesync::motion::MotionTrack& track,
                        const std::vector<framesync::sync::SyncedFrame>& frames,
                        const framesync::projection::ProjectionSnapshot& snapshot,
                        double fps) {
  cv::VideoCapture capture(video_path.string());
  if (!capture.isOpened()) {
    spdlog::error("Could not reopen video for overlay: {}", video_path.string());
    return;
  }

  const cv::Size frame_size(static_cast<int>(capture.get(cv::CAP_PROP_FRAME_WIDTH)),
                            static_cast<int>(capture.get(cv::CAP_PROP_FRAME_HEIGHT)));
  cv::VideoWriter writer(output_path.string(), cv::VideoWriter::fourcc('m', 'p', '4', 'v'), fps > 0.0 ? fps : 30.0,
                         frame_size);
  if (!writer.isOpened()) {
    spdlog::error("Could not open overlay writer: {}", output_path.string());
    return;
  }

  std::size_t drawn = 0;
  cv::Mat image;
  for (const auto& frame : frames) {
    if (!capture.read(image)) {
      break;
    }
    if (DrawFrameOverlay(image, style, track, frame, snapshot)) {
      ++drawn;
    }
    writer.write(image);
  }
  spdlog::info("Overlay video written to {} ({} frames drawn)", output_path.string(), drawn);
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App app{"framesync video/motion timestamp alignment pipeline"};
  std::string config_path;
  double offset_override = 0.0;
  double gap_threshold_override = 0.0;
  std::string calibration_override;
  std::string output_dir_override;
  bool no_export = false;
  bool render_overlay = false;
  std::string overlay_style_override;
  std::string log_level = "info";
  app.add_option("--config", config_path, "Path to session YAML")->required();
  CLI::Option* offset_option = app.add_option("--offset", offset_override, "Seconds added to every frame timestamp");
  CLI::Option* gap_option =
      app.add_option("--gap-threshold", gap_threshold_override, "Bracket width in seconds treated as a recording gap");
  app.add_option("--calibration", calibration_override, "Calibration JSON path");
  app.add_option("--output-dir", output_dir_override, "Output directory");
  app.add_flag("--no-export", no_export, "Skip synced_poses.json export");
  app.add_flag("--render-overlay", render_overlay, "Write an overlay video with projected hand poses");
  app.add_option("--overlay-style", overlay_style_override, "gizmo or comparison")
      ->check(CLI::IsMember({"gizmo", "comparison"}));
  app.add_option("--log-level", log_level, "trace, debug, info, warn, error");

  CLI11_PARSE(app, argc, argv);

  spdlog::set_level(spdlog::level::from_str(log_level));
  spdlog::info("framesync version: {}", framesync::common::version());

  try {
    framesync::io::SessionConfig config = framesync::io::LoadSessionConfig(config_path);
    if (offset_option->count() > 0) {
      config.timestamp_offset = offset_override;
    }
    if (gap_option->count() > 0) {
      config.options.gap_threshold = gap_threshold_override;
    }
    if (!calibration_override.empty()) {
      config.calibration_path = calibration_override;
    }
    if (!output_dir_override.empty()) {
      config.output_dir = output_dir_override;
    }
    if (no_export) {
      config.options.export_synced_json = false;
    }
    if (render_overlay) {
      config.options.render_overlay = true;
    }
    if (!overlay_style_override.empty()) {
      config.options.overlay_style = framesync::io::ParseOverlayStyle(overlay_style_override);
    }
    if (config.options.worker_threads > 0) {
      cv::setNumThreads(config.options.worker_threads);
    }

    std::filesystem::create_directories(config.output_dir);

    spdlog::info("Stage 1: loading motion from {}", config.motion_path.string());
    const auto sources = framesync::motion::LoadMotionSources(config.motion_path);
    const framesync::motion::MotionTrack track = framesync::motion::MotionTrack::Build(sources);
    if (const auto range = track.TimeRange()) {
      spdlog::info("Motion time range: [{:.3f}, {:.3f}]", range->first, range->second);
    }

    spdlog::info("Stage 2: frame timestamps");
    std::vector<double> frame_timestamps;
    std::filesystem::path video_path;
    double fps = 0.0;
    int width = config.image_width;
    int height = config.image_height;
    if (!config.frame_timestamps_path.empty()) {
      frame_timestamps = framesync::io::LoadFrameTimestampsCsv(config.frame_timestamps_path);
    } else {
      video_path = config.options.use_compressed ? framesync::io::ResolveCompressedVideo(config.video_path)
                                                 : config.video_path;
      framesync::io::VideoInfo video = framesync::io::ReadVideoInfo(video_path);
      frame_timestamps = std::move(video.frame_timestamps_s);
      fps = video.fps;
      width = video.width;
      height = video.height;
    }

    spdlog::info("Stage 3: interpolation (offset {:.6f}, gap threshold {:.3f})", config.timestamp_offset,
                 config.options.gap_threshold);
    framesync::projection::CalibratedProjector projector(width, height);
    if (!config.calibration_path.empty()) {
      std::string calibration_error;
      if (!projector.Load(config.calibration_path, &calibration_error)) {
        spdlog::warn("{}; using default calibration", calibration_error);
      }
    }
    const auto snapshot = projector.Snapshot();
    spdlog::info("Projection fov {:.1f} deg, focal length {:.1f} px", snapshot->calibration().field_of_view_deg,
                 snapshot->intrinsics().focal_length);

    const framesync::sync::FrameSynchronizer synchronizer(
        track, framesync::sync::SyncOptions{config.timestamp_offset, config.options.gap_threshold});
    const auto frames = synchronizer.Run(frame_timestamps, snapshot.get());

    spdlog::info("Stage 4: outputs");
    if (config.options.export_synced_json) {
      framesync::sync::SyncedExportMetadata metadata;
      metadata.video_path = video_path.empty() ? config.frame_timestamps_path.string() : video_path.string();
      for (const auto& source : sources) {
        metadata.motion_sources.push_back(source.name);
      }
      metadata.fps = fps;
      metadata.timestamp_offset = config.timestamp_offset;
      metadata.gap_threshold = config.options.gap_threshold;
      framesync::sync::WriteSyncedPoses(config.output_dir / "synced_poses.json", frames, metadata);
    }

    if (config.options.render_overlay) {
      if (video_path.empty()) {
        spdlog::warn("Overlay rendering needs video_path; skipping");
      } else {
        const auto overlay_path =
            config.output_dir / fmt::format("overlay_{}.mp4", framesync::io::OverlayStyleName(config.options.overlay_style));
        RenderOverlayVideo(video_path, overlay_path, config.options.overlay_style, track, frames, *snapshot, fps);
      }
    }
  } catch (const std::exception& ex) {
    spdlog::error("Pipeline failed: {}", ex.what());
    return 1;
  }

  return 0;
}
