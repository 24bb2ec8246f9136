#pragma once
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <string>

#include "types.hpp"

constexpr size_t kMaxExperimentNameLength = 80;
constexpr const char* kDefaultExperimentName = "experiment";
constexpr const char* kTimelapsesDirName = "Timelapses";
constexpr const char* kSettingsFileName = "settings.json";
constexpr const char* kRunLogFileName = "run.log";

// Persisted settings record. Written once when the run directory is created.
struct RunRecord {
  std::string experiment;
  std::string created_at;  // "YYYY-MM-DD HH:MM:SS", local time
  int interval_seconds{0};
  Resolution resolution{};
  int total_photos{0};
  std::string folder;
  bool auto_video{false};
};

// Append-only, timestamped line log kept inside the run directory.
class RunLog {
public:
  explicit RunLog(const std::filesystem::path& path);
  ~RunLog();
  RunLog(const RunLog&) = delete;
  RunLog& operator=(const RunLog&) = delete;

  void write(const std::string& line);
  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  std::shared_ptr<spdlog::logger> logger_;
};

struct RunHandle {
  std::filesystem::path directory;
  std::filesystem::path settings_path;
  RunRecord record;
  std::shared_ptr<RunLog> log;
};

std::string sanitize_experiment_name(const std::string& name);

// "%Y%m%d_%H%M%S" in local time; used for run directory names.
std::string file_stamp(WallClock::time_point t);
// Same format in UTC; used for image names, which must sort in capture order across DST changes.
std::string utc_file_stamp(WallClock::time_point t);
// "%Y-%m-%d %H:%M:%S" in local time; used for display and records.
std::string human_stamp(WallClock::time_point t);

class RunDirectoryManager {
public:
  // Creates <config.output_directory>/Timelapses/<name>_<stamp>/, writes settings.json and
  // opens run.log. Runs that share a name and a second share a directory.
  RunHandle prepare_run(const RunConfiguration& config,
                        WallClock::time_point now = WallClock::now()) const;

  static std::filesystem::path runs_root(const std::filesystem::path& pictures_root);
};

void write_run_record(const std::filesystem::path& path, const RunRecord& record);
// Throws ConfigurationError if the file is missing or malformed.
RunRecord read_run_record(const std::filesystem::path& run_directory);
