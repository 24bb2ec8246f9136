#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "control_server.hpp"
#include "errors.hpp"
#include "observers.hpp"
#include "session.hpp"
#include "util.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) { g_interrupted = true; }

int run_foreground(TimelapseSession& session, const RunConfiguration& cfg) {
  auto handle = session.start_run(cfg);
  if (!handle) {
    spdlog::error("A timelapse is already running.");
    return 1;
  }
  spdlog::info("Saving to {} (Ctrl-C to stop)", handle->directory.string());

  ConsoleObserver observer;
  bool stop_sent = false;
  while (!observer.finished()) {
    session.reporter().wait_and_dispatch(observer, std::chrono::milliseconds(200));
    if (g_interrupted && !stop_sent) {
      session.cancel_run();
      stop_sent = true;
    }
  }
  session.wait();
  session.reporter().dispatch(observer);
  return observer.errors() == 0 ? 0 : 2;
}

int run_preview(TimelapseSession& session) {
  session.start_preview();
  spdlog::info("Preview open (Ctrl-C to close)");
  while (!g_interrupted && session.preview_running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  session.stop_preview();
  return 0;
}

int run_server(TimelapseSession& session) {
  StatusBoard board;
  std::atomic<bool> observing{true};
  std::thread observer_thread([&] {
    while (observing) {
      session.reporter().wait_and_dispatch(board, std::chrono::milliseconds(200));
    }
    session.reporter().dispatch(board);
  });

  httplib::Server svr;
  register_routes(svr, session, board);

  std::thread watchdog([&] {
    while (!g_interrupted && observing) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    svr.stop();
  });

  const auto& server = session.config().server;
  spdlog::info("HTTP server listening on {}:{}", server.host, server.port);
  const bool ok = svr.listen(server.host, server.port);
  if (!ok) spdlog::error("Failed to listen on {}:{}", server.host, server.port);

  session.shutdown();
  observing = false;
  watchdog.join();
  observer_thread.join();
  spdlog::info("Shutdown complete.");
  return ok ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"PetriWatch: Raspberry Pi camera timelapse acquisition"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path");

  std::string log_level;
  cli_app.add_option("--log-level", log_level, "debug|info|warn|error (overrides config)");

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  auto* run_cmd = cli_app.add_subcommand("run", "Run a timelapse in the foreground");
  std::string name, resolution, root;
  int interval = 0, shots = 0;
  bool auto_video = false;
  run_cmd->add_option("-n,--name", name, "Experiment name");
  auto* interval_opt =
      run_cmd->add_option("-i,--interval", interval, "Interval between photos in seconds");
  auto* shots_opt = run_cmd->add_option("-s,--shots", shots, "Number of photos");
  run_cmd->add_option("-r,--resolution", resolution, "WIDTHxHEIGHT");
  run_cmd->add_option("--root", root, "Pictures root (Timelapses/ is created inside)");
  run_cmd->add_flag("--auto-video", auto_video, "Assemble a video when the run completes");

  auto* assemble_cmd = cli_app.add_subcommand("assemble", "Build a video from a run directory");
  std::string run_dir, output_name;
  int fps = 0;
  assemble_cmd->add_option("directory", run_dir, "Run directory")->required()->check(
      CLI::ExistingDirectory);
  assemble_cmd->add_option("--fps", fps, "Frame rate (default from config)");
  assemble_cmd->add_option("-o,--output", output_name, "Output file name");

  auto* preview_cmd = cli_app.add_subcommand("preview", "Open the camera preview");
  auto* serve_cmd = cli_app.add_subcommand("serve", "Start the HTTP control server");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "PetriWatch v1.0.0" << std::endl;
    std::cout << "Timelapse capture via rpicam-still/libcamera-still" << std::endl;
    return 0;
  }
  if (cli_app.get_subcommands().empty()) {
    std::cout << cli_app.help() << std::endl;
    return 1;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  AppConfig app;
  try {
    if (std::filesystem::exists(cfg_path)) {
      app = load_config(cfg_path);
      spdlog::info("PetriWatch starting (config: {})", cfg_path);
    } else {
      spdlog::warn("Config file {} not found, using defaults", cfg_path);
    }
  } catch (const ConfigurationError& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
  if (!log_level.empty()) app.log_level = log_level;
  if (!apply_log_level(app.log_level)) {
    spdlog::error("Invalid log level '{}'", app.log_level);
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  try {
    TimelapseSession session(app);

    if (*run_cmd) {
      RunConfiguration cfg = default_run_configuration(app);
      if (!name.empty()) cfg.experiment_name = name;
      if (*interval_opt) cfg.interval_seconds = interval;
      if (*shots_opt) cfg.total_shots = shots;
      if (!resolution.empty()) cfg.resolution = parse_resolution(resolution);
      if (!root.empty()) cfg.output_directory = root;
      if (auto_video) cfg.auto_video = true;
      return run_foreground(session, cfg);
    }
    if (*assemble_cmd) {
      const auto video = session.assemble_video(run_dir, fps, output_name);
      spdlog::info("Video saved as {}", video.string());
      return 0;
    }
    if (*preview_cmd) return run_preview(session);
    if (*serve_cmd) return run_server(session);
  } catch (const ConfigurationError& e) {
    spdlog::error("Invalid configuration: {}", e.what());
    return 1;
  } catch (const CommandNotFoundError& e) {
    spdlog::error("{}", e.what());
    return 1;
  } catch (const EncodingError& e) {
    spdlog::error("Error creating video: {}", e.what());
    return 1;
  } catch (const std::exception& e) {
    spdlog::error("Unhandled error: {}", e.what());
    return 1;
  }
  return 0;
}
