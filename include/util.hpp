#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "types.hpp"

struct CameraConfig {
  bool hflip{true};
  bool vflip{true};
  int preview_stop_timeout_ms{2000};
  std::string search_path;  // empty: use $PATH
};

struct StorageConfig {
  std::string pictures_root;  // empty: $HOME/Pictures
};

struct RunDefaults {
  std::string experiment_name{"timelapse"};
  int interval_seconds{300};
  int total_shots{144};
  Resolution resolution{2028, 1520};
  bool auto_video{false};
  std::vector<Resolution> allowed_resolutions{{4056, 3040}, {2028, 1520}, {1014, 760}};
};

struct VideoConfig {
  std::string encoder{"ffmpeg"};  // "ffmpeg" or "opencv"
  int fps{25};
  std::string output_name{"timelapse.mp4"};
  // ffmpeg
  std::string ffmpeg_binary{"ffmpeg"};
  std::string codec{"libx264"};
  std::string pixel_format{"yuv420p"};
  // opencv
  std::string fourcc{"mp4v"};
};

struct ServerConfig {
  std::string host{"0.0.0.0"};
  int port{8080};
};

struct AppConfig {
  CameraConfig camera;
  StorageConfig storage;
  RunDefaults run;
  VideoConfig video;
  ServerConfig server;
  std::string log_level{"info"};
};

// Missing keys keep their defaults. Throws ConfigurationError on unreadable or invalid YAML.
AppConfig load_config(const std::string& path);

std::filesystem::path default_pictures_root();
std::filesystem::path pictures_root(const AppConfig& app);

// Run configuration prefilled from the config file defaults.
RunConfiguration default_run_configuration(const AppConfig& app);

// Accepts debug|info|warn|error. Returns false for anything else.
bool apply_log_level(const std::string& level);
