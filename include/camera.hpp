#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "command_resolver.hpp"
#include "subprocess.hpp"
#include "types.hpp"
#include "util.hpp"

constexpr const char* kStillAction = "still";
constexpr const char* kPreviewAction = "hello";

// One still capture per call through the resolved rpicam-still/libcamera-still binary.
class StillCapture {
public:
  StillCapture(std::filesystem::path binary, Resolution resolution, const CameraConfig& camera);

  std::vector<std::string> command_line(const std::filesystem::path& dest) const;
  // Blocking. A non-zero exit or a missing image becomes a failed outcome; throws CaptureFailure
  // when the process could not be started or waited for.
  CaptureOutcome operator()(int sequence, const std::filesystem::path& dest) const;

  const std::filesystem::path& binary() const { return binary_; }

private:
  std::filesystem::path binary_;
  Resolution resolution_;
  bool hflip_;
  bool vflip_;
};

// Live preview window (rpicam-hello -t 0). At most one at a time.
class PreviewController {
public:
  PreviewController(const CommandResolver& resolver, const CameraConfig& camera);

  // Returns false if already open. Throws CommandNotFoundError.
  bool start();
  // Returns false if it was not open.
  bool stop();
  bool running();

  std::vector<std::string> command_line(const std::filesystem::path& binary) const;

private:
  const CommandResolver& resolver_;
  CameraConfig camera_;
  std::mutex mu_;
  ChildProcess process_;
};
