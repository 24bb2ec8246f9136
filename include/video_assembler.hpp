#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "command_resolver.hpp"
#include "util.hpp"

class VideoEncoder {
public:
  virtual ~VideoEncoder() = default;
  virtual std::string name() const = 0;
  // `frames` is non-empty and sorted. Throws EncodingError.
  virtual void encode(const std::filesystem::path& directory,
                      const std::vector<std::filesystem::path>& frames, int fps,
                      const std::filesystem::path& output) = 0;
};

// Backslash-escapes glob(3) metacharacters so `text` matches only itself.
std::string escape_glob(const std::string& text);

// Runs the external ffmpeg binary over a glob of the run's images. The directory part of the
// pattern is escaped; only "*.jpg" is a wildcard.
class FfmpegEncoder : public VideoEncoder {
public:
  FfmpegEncoder(VideoConfig cfg, CommandResolver resolver);
  std::string name() const override { return "ffmpeg"; }
  void encode(const std::filesystem::path& directory,
              const std::vector<std::filesystem::path>& frames, int fps,
              const std::filesystem::path& output) override;

  std::vector<std::string> command_line(const std::filesystem::path& binary,
                                        const std::filesystem::path& directory, int fps,
                                        const std::filesystem::path& output) const;

private:
  VideoConfig cfg_;
  CommandResolver resolver_;
};

// Writes frames in-process with cv::VideoWriter.
class OpenCvEncoder : public VideoEncoder {
public:
  explicit OpenCvEncoder(VideoConfig cfg);
  std::string name() const override { return "opencv"; }
  void encode(const std::filesystem::path& directory,
              const std::vector<std::filesystem::path>& frames, int fps,
              const std::filesystem::path& output) override;

private:
  VideoConfig cfg_;
};

// Throws ConfigurationError for an unknown encoder name.
std::unique_ptr<VideoEncoder> create_encoder(const VideoConfig& cfg,
                                             const CommandResolver& resolver);

class VideoAssembler {
public:
  explicit VideoAssembler(std::unique_ptr<VideoEncoder> encoder);

  // Encodes the directory's .jpg files in filename order into `output_name` (relative names
  // land inside `directory`). Throws EncodingError; never retries.
  std::filesystem::path assemble(const std::filesystem::path& directory, int fps,
                                 const std::string& output_name);

  // Lexicographically sorted .jpg files directly inside `directory`.
  static std::vector<std::filesystem::path> list_frames(const std::filesystem::path& directory);

  const VideoEncoder& encoder() const { return *encoder_; }

private:
  std::unique_ptr<VideoEncoder> encoder_;
};
