#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "camera.hpp"
#include "command_resolver.hpp"
#include "metrics.hpp"
#include "reporter.hpp"
#include "run_directory.hpp"
#include "scheduler.hpp"
#include "types.hpp"
#include "util.hpp"

// Everything an application session needs: binary lookup, preview child, one scheduler, the
// reporter channel and the metrics. One instance per process.
class TimelapseSession {
public:
  explicit TimelapseSession(AppConfig app, std::shared_ptr<SchedulerClock> clock = nullptr,
                            Clock::duration poll_slice = kDefaultPollSlice);
  ~TimelapseSession();
  TimelapseSession(const TimelapseSession&) = delete;
  TimelapseSession& operator=(const TimelapseSession&) = delete;

  // Validates, resolves the capture binary, creates the run directory, closes the preview and
  // starts acquisition. Returns nullopt if a run is already active. Throws ConfigurationError or
  // CommandNotFoundError before anything is written.
  std::optional<RunHandle> start_run(const RunConfiguration& cfg);
  bool cancel_run();
  void wait();

  // fps <= 0 and an empty name fall back to the video config. Throws EncodingError.
  std::filesystem::path assemble_video(const std::filesystem::path& run_dir, int fps = 0,
                                       const std::string& output_name = "") const;

  bool start_preview() { return preview_.start(); }
  bool stop_preview() { return preview_.stop(); }
  bool preview_running() { return preview_.running(); }

  SchedulerState state() const { return scheduler_.state(); }
  bool active() const { return scheduler_.active(); }
  int completed_shots() const { return scheduler_.completed_shots(); }
  std::optional<RunHandle> current_run() const;

  Reporter& reporter() { return reporter_; }
  CaptureMetrics& metrics() { return metrics_; }
  const AppConfig& config() const { return app_; }
  const CommandResolver& resolver() const { return resolver_; }

  // Cancels any run, waits for it and closes the preview.
  void shutdown();

private:
  AppConfig app_;
  CommandResolver resolver_;
  RunDirectoryManager dirs_;
  PreviewController preview_;
  Reporter reporter_;
  CaptureMetrics metrics_;

  mutable std::mutex mu_;
  std::optional<RunHandle> run_;

  // Last member: its destructor joins the loop thread while the members above are alive.
  AcquisitionScheduler scheduler_;
};
