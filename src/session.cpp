#include "session.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "errors.hpp"
#include "video_assembler.hpp"

namespace {

CommandResolver make_resolver(const CameraConfig& camera) {
  return camera.search_path.empty() ? CommandResolver() : CommandResolver(camera.search_path);
}

}  // namespace

TimelapseSession::TimelapseSession(AppConfig app, std::shared_ptr<SchedulerClock> clock,
                                   Clock::duration poll_slice)
    : app_(std::move(app)),
      resolver_(make_resolver(app_.camera)),
      preview_(resolver_, app_.camera),
      scheduler_(std::move(clock), poll_slice) {}

TimelapseSession::~TimelapseSession() { shutdown(); }

std::optional<RunHandle> TimelapseSession::start_run(const RunConfiguration& cfg) {
  std::lock_guard<std::mutex> g(mu_);
  if (scheduler_.active()) {
    spdlog::warn("A timelapse is already running; start ignored.");
    return std::nullopt;
  }

  validate_run_configuration(cfg, app_.run.allowed_resolutions);
  const auto still = resolver_.resolve(kStillAction);

  RunHandle handle = dirs_.prepare_run(cfg);
  preview_.stop();

  SchedulerCallbacks cb = reporter_.callbacks();
  cb.capture = StillCapture(still, cfg.resolution, app_.camera);
  cb.on_attempt = [this](const CaptureAttempt& a) {
    metrics_.add_capture(a.outcome.elapsed_seconds, a.outcome.success);
  };

  const bool auto_video = cfg.auto_video;
  const auto run_dir = handle.directory;
  const auto run_log = handle.log;
  cb.on_complete = [this, auto_video, run_dir, run_log](SchedulerState final_state) {
    if (final_state == SchedulerState::Finished && auto_video) {
      try {
        const auto video = assemble_video(run_dir);
        run_log->write("Video saved as " + video.filename().string());
        reporter_.post_log("Video saved as " + video.string());
      } catch (const EncodingError& e) {
        run_log->write(std::string("ERROR  video  ") + e.what());
        reporter_.post_error(std::string("Error creating video: ") + e.what());
      } catch (const ConfigurationError& e) {
        reporter_.post_error(std::string("Error creating video: ") + e.what());
      }
    }
    reporter_.post_finished(final_state);
  };

  ScheduleRequest req;
  req.total_shots = cfg.total_shots;
  req.interval = std::chrono::seconds(cfg.interval_seconds);
  req.output_dir = handle.directory;
  req.run_log = handle.log;

  if (!scheduler_.start(std::move(req), std::move(cb))) {
    return std::nullopt;
  }
  metrics_.inc_run();
  spdlog::info("Timelapse started: {} photos every {}s at {} into {}", cfg.total_shots,
               cfg.interval_seconds, to_string(cfg.resolution), handle.directory.string());

  run_ = handle;
  return handle;
}

bool TimelapseSession::cancel_run() {
  if (!scheduler_.active() || scheduler_.state() != SchedulerState::Running) return false;
  scheduler_.cancel();
  reporter_.post_log("Stop requested...");
  return true;
}

void TimelapseSession::wait() { scheduler_.wait(); }

std::filesystem::path TimelapseSession::assemble_video(const std::filesystem::path& run_dir,
                                                       int fps,
                                                       const std::string& output_name) const {
  VideoAssembler assembler(create_encoder(app_.video, resolver_));
  return assembler.assemble(run_dir, fps > 0 ? fps : app_.video.fps,
                            output_name.empty() ? app_.video.output_name : output_name);
}

std::optional<RunHandle> TimelapseSession::current_run() const {
  std::lock_guard<std::mutex> g(mu_);
  return run_;
}

void TimelapseSession::shutdown() {
  scheduler_.cancel();
  scheduler_.wait();
  preview_.stop();
}
