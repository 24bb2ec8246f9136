#include "camera.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <system_error>
#include <utility>

#include "errors.hpp"

StillCapture::StillCapture(std::filesystem::path binary, Resolution resolution,
                           const CameraConfig& camera)
    : binary_(std::move(binary)),
      resolution_(resolution),
      hflip_(camera.hflip),
      vflip_(camera.vflip) {}

std::vector<std::string> StillCapture::command_line(const std::filesystem::path& dest) const {
  std::vector<std::string> argv{binary_.string(),
                                "-o",
                                dest.string(),
                                "-n",
                                "--width",
                                std::to_string(resolution_.width),
                                "--height",
                                std::to_string(resolution_.height)};
  if (hflip_) argv.emplace_back("--hflip");
  if (vflip_) argv.emplace_back("--vflip");
  return argv;
}

CaptureOutcome StillCapture::operator()(int sequence, const std::filesystem::path& dest) const {
  const auto t0 = std::chrono::steady_clock::now();
  ProcessResult r = run_process(command_line(dest), true);
  const double elapsed =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

  if (!r.error.empty()) throw CaptureFailure(r.error);
  if (!r.ok()) {
    spdlog::debug("Capture {} failed: {}", sequence, r.describe());
    return CaptureOutcome::failed(r.describe(), elapsed);
  }
  std::error_code ec;
  if (!std::filesystem::exists(dest, ec)) {
    return CaptureOutcome::failed("no image written", elapsed);
  }
  return CaptureOutcome::ok(elapsed);
}

PreviewController::PreviewController(const CommandResolver& resolver, const CameraConfig& camera)
    : resolver_(resolver), camera_(camera) {}

std::vector<std::string> PreviewController::command_line(
    const std::filesystem::path& binary) const {
  std::vector<std::string> argv{binary.string(), "-t", "0"};
  if (camera_.hflip) argv.emplace_back("--hflip");
  if (camera_.vflip) argv.emplace_back("--vflip");
  return argv;
}

bool PreviewController::start() {
  std::lock_guard<std::mutex> g(mu_);
  if (process_.running()) {
    spdlog::info("Preview is already open.");
    return false;
  }
  process_.spawn(command_line(resolver_.resolve(kPreviewAction)));
  spdlog::info("Preview started (pid {}).", process_.pid());
  return true;
}

bool PreviewController::stop() {
  std::lock_guard<std::mutex> g(mu_);
  if (!process_.running()) {
    spdlog::debug("Preview was already closed.");
    return false;
  }
  if (!process_.terminate(std::chrono::milliseconds(camera_.preview_stop_timeout_ms))) {
    spdlog::warn("Preview had to be killed.");
  }
  spdlog::info("Preview closed.");
  return true;
}

bool PreviewController::running() {
  std::lock_guard<std::mutex> g(mu_);
  return process_.running();
}
