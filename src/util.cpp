#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

#include "errors.hpp"

namespace {

AppConfig parse_config(const YAML::Node& y) {
  AppConfig c{};

  if (y["camera"]) {
    auto cam = y["camera"];
    if (cam["hflip"]) c.camera.hflip = cam["hflip"].as<bool>();
    if (cam["vflip"]) c.camera.vflip = cam["vflip"].as<bool>();
    if (cam["preview_stop_timeout_ms"])
      c.camera.preview_stop_timeout_ms = cam["preview_stop_timeout_ms"].as<int>();
    if (cam["search_path"]) c.camera.search_path = cam["search_path"].as<std::string>();
  }

  if (y["storage"] && y["storage"]["pictures_root"])
    c.storage.pictures_root = y["storage"]["pictures_root"].as<std::string>();

  if (y["run"]) {
    auto run = y["run"];
    if (run["experiment_name"])
      c.run.experiment_name = run["experiment_name"].as<std::string>();
    if (run["interval_seconds"]) c.run.interval_seconds = run["interval_seconds"].as<int>();
    // The GUI offered minutes; keep accepting that spelling.
    if (run["interval_minutes"])
      c.run.interval_seconds = interval_from_minutes(run["interval_minutes"].as<long long>());
    if (run["total_shots"]) c.run.total_shots = run["total_shots"].as<int>();
    if (run["resolution"]) c.run.resolution = parse_resolution(run["resolution"].as<std::string>());
    if (run["auto_video"]) c.run.auto_video = run["auto_video"].as<bool>();

    if (run["allowed_resolutions"]) {
      c.run.allowed_resolutions.clear();
      for (const auto& r : run["allowed_resolutions"]) {
        c.run.allowed_resolutions.push_back(parse_resolution(r.as<std::string>()));
      }
    }
  }

  if (y["video"]) {
    auto v = y["video"];
    if (v["encoder"]) c.video.encoder = v["encoder"].as<std::string>();
    if (v["fps"]) c.video.fps = v["fps"].as<int>();
    if (v["output_name"]) c.video.output_name = v["output_name"].as<std::string>();
    if (v["ffmpeg_binary"]) c.video.ffmpeg_binary = v["ffmpeg_binary"].as<std::string>();
    if (v["codec"]) c.video.codec = v["codec"].as<std::string>();
    if (v["pixel_format"]) c.video.pixel_format = v["pixel_format"].as<std::string>();
    if (v["fourcc"]) c.video.fourcc = v["fourcc"].as<std::string>();
  }

  if (y["server"]) {
    if (y["server"]["host"]) c.server.host = y["server"]["host"].as<std::string>();
    if (y["server"]["port"]) c.server.port = y["server"]["port"].as<int>();
  }

  if (y["logging"] && y["logging"]["level"])
    c.log_level = y["logging"]["level"].as<std::string>();

  if (c.video.fps <= 0) throw ConfigurationError("video.fps must be positive");
  if (c.video.fourcc.size() != 4) throw ConfigurationError("video.fourcc must be 4 characters");
  return c;
}

}  // namespace

AppConfig load_config(const std::string& path) {
  try {
    return parse_config(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw ConfigurationError("Failed to load config '" + path + "': " + e.what());
  }
}

std::filesystem::path default_pictures_root() {
  const char* home = std::getenv("HOME");
  return std::filesystem::path(home ? home : ".") / "Pictures";
}

std::filesystem::path pictures_root(const AppConfig& app) {
  return app.storage.pictures_root.empty() ? default_pictures_root()
                                           : std::filesystem::path(app.storage.pictures_root);
}

RunConfiguration default_run_configuration(const AppConfig& app) {
  RunConfiguration r;
  r.experiment_name = app.run.experiment_name;
  r.interval_seconds = app.run.interval_seconds;
  r.total_shots = app.run.total_shots;
  r.resolution = app.run.resolution;
  r.auto_video = app.run.auto_video;
  r.output_directory = pictures_root(app);
  return r;
}

bool apply_log_level(const std::string& level) {
  if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    return false;
  }
  return true;
}
