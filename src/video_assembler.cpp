#include "video_assembler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <system_error>
#include <utility>

#include "errors.hpp"
#include "subprocess.hpp"

std::string escape_glob(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '\\' || c == '*' || c == '?' || c == '[' || c == ']') out += '\\';
    out += c;
  }
  return out;
}

FfmpegEncoder::FfmpegEncoder(VideoConfig cfg, CommandResolver resolver)
    : cfg_(std::move(cfg)), resolver_(std::move(resolver)) {}

std::vector<std::string> FfmpegEncoder::command_line(const std::filesystem::path& binary,
                                                     const std::filesystem::path& directory,
                                                     int fps,
                                                     const std::filesystem::path& output) const {
  return {binary.string(),
          "-y",
          "-loglevel",
          "error",
          "-framerate",
          std::to_string(fps),
          "-pattern_type",
          "glob",
          "-i",
          (std::filesystem::path(escape_glob(directory.string())) / "*.jpg").string(),
          "-c:v",
          cfg_.codec,
          "-pix_fmt",
          cfg_.pixel_format,
          output.string()};
}

void FfmpegEncoder::encode(const std::filesystem::path& directory,
                           const std::vector<std::filesystem::path>& /*frames*/, int fps,
                           const std::filesystem::path& output) {
  const auto binary = resolver_.find_program(cfg_.ffmpeg_binary);
  if (binary.empty()) {
    throw EncodingError("Encoder '" + cfg_.ffmpeg_binary + "' not found");
  }

  const auto argv = command_line(binary, directory, fps, output);
  spdlog::debug("Running encoder: {} ... {}", argv.front(), argv.back());
  ProcessResult r = run_process(argv);
  if (!r.ok()) {
    throw EncodingError("Encoder failed: " + r.describe());
  }
}

OpenCvEncoder::OpenCvEncoder(VideoConfig cfg) : cfg_(std::move(cfg)) {}

void OpenCvEncoder::encode(const std::filesystem::path& /*directory*/,
                           const std::vector<std::filesystem::path>& frames, int fps,
                           const std::filesystem::path& output) {
  // The first readable frame fixes the video size.
  cv::Mat first = cv::imread(frames.front().string());
  if (first.empty()) {
    throw EncodingError("Cannot read first frame " + frames.front().string());
  }
  const cv::Size frame_size(first.cols, first.rows);

  const int fourcc =
      cv::VideoWriter::fourcc(cfg_.fourcc[0], cfg_.fourcc[1], cfg_.fourcc[2], cfg_.fourcc[3]);
  cv::VideoWriter writer(output.string(), fourcc, fps, frame_size);
  if (!writer.isOpened()) {
    throw EncodingError("Failed to initialize video writer for: " + output.string());
  }

  size_t written = 0;
  for (const auto& path : frames) {
    cv::Mat image = path == frames.front() ? first : cv::imread(path.string());
    if (image.empty()) {
      spdlog::warn("Skipping unreadable frame {}", path.string());
      continue;
    }
    if (image.size() != frame_size) cv::resize(image, image, frame_size);
    writer.write(image);
    if (++written % 100 == 0) spdlog::info("Written {}/{} frames", written, frames.size());
  }
  writer.release();

  if (written == 0) throw EncodingError("No frame could be written");
}

std::unique_ptr<VideoEncoder> create_encoder(const VideoConfig& cfg,
                                             const CommandResolver& resolver) {
  if (cfg.encoder == "ffmpeg") return std::make_unique<FfmpegEncoder>(cfg, resolver);
  if (cfg.encoder == "opencv") return std::make_unique<OpenCvEncoder>(cfg);
  throw ConfigurationError("Unknown video encoder '" + cfg.encoder + "' (expected ffmpeg|opencv)");
}

VideoAssembler::VideoAssembler(std::unique_ptr<VideoEncoder> encoder)
    : encoder_(std::move(encoder)) {}

std::vector<std::filesystem::path> VideoAssembler::list_frames(
    const std::filesystem::path& directory) {
  std::vector<std::filesystem::path> frames;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".jpg") {
      frames.push_back(entry.path());
    }
  }
  std::sort(frames.begin(), frames.end(),
            [](const auto& a, const auto& b) { return a.filename() < b.filename(); });
  return frames;
}

std::filesystem::path VideoAssembler::assemble(const std::filesystem::path& directory, int fps,
                                               const std::string& output_name) {
  if (fps <= 0) throw EncodingError("Frame rate must be positive");
  if (!std::filesystem::is_directory(directory)) {
    throw EncodingError("Not a directory: " + directory.string());
  }

  const auto frames = list_frames(directory);
  if (frames.empty()) throw EncodingError("No images found in " + directory.string());

  std::filesystem::path output(output_name.empty() ? "timelapse.mp4" : output_name);
  if (output.is_relative()) output = directory / output;

  spdlog::info("Assembling {} frames from {} at {} fps with {}", frames.size(),
               directory.string(), fps, encoder_->name());
  const auto t0 = std::chrono::steady_clock::now();

  encoder_->encode(directory, frames, fps, output);

  if (!std::filesystem::exists(output)) {
    throw EncodingError("Encoder reported success but " + output.string() + " is missing");
  }
  const double secs =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  spdlog::info("Video saved as {} ({:.2f}s)", output.string(), secs);
  return output;
}
