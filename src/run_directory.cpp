#include "run_directory.hpp"

#include <spdlog/sinks/basic_file_sink.h>

#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

#include "errors.hpp"

namespace {

std::string format_time(WallClock::time_point t, const char* fmt, bool utc) {
  std::time_t tt = WallClock::to_time_t(t);
  std::tm tm{};
  if (utc) {
    gmtime_r(&tt, &tm);
  } else {
    localtime_r(&tt, &tm);
  }
  std::ostringstream ss;
  ss << std::put_time(&tm, fmt);
  return ss.str();
}

}  // namespace

std::string file_stamp(WallClock::time_point t) { return format_time(t, "%Y%m%d_%H%M%S", false); }

std::string utc_file_stamp(WallClock::time_point t) {
  return format_time(t, "%Y%m%d_%H%M%S", true);
}

std::string human_stamp(WallClock::time_point t) { return format_time(t, "%Y-%m-%d %H:%M:%S", false); }

std::string sanitize_experiment_name(const std::string& name) {
  static const std::string kReserved = "<>:\"/\\|?*";

  // Length is counted in UTF-8 code points; a sequence is never split.
  std::string out;
  size_t code_points = 0;
  bool pending_sep = false;
  for (char ch : name) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isspace(c)) {
      pending_sep = !out.empty();
      continue;
    }
    if (pending_sep) {
      if (code_points == kMaxExperimentNameLength) break;
      out += '_';
      ++code_points;
      pending_sep = false;
    }
    const bool continuation = (c & 0xC0) == 0x80;
    if (!continuation) {
      if (code_points == kMaxExperimentNameLength) break;
      ++code_points;
    }
    out += kReserved.find(ch) != std::string::npos ? '_' : ch;
  }
  if (out.empty()) return kDefaultExperimentName;
  return out;
}

RunLog::RunLog(const std::filesystem::path& path) : path_(path) {
  auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
  logger_ = std::make_shared<spdlog::logger>("run:" + path.parent_path().filename().string(),
                                             std::move(sink));
  logger_->set_pattern("%Y-%m-%d %H:%M:%S  %v");
  logger_->set_level(spdlog::level::trace);
  logger_->flush_on(spdlog::level::trace);
}

RunLog::~RunLog() {
  if (logger_) logger_->flush();
}

void RunLog::write(const std::string& line) { logger_->info(line); }

std::filesystem::path RunDirectoryManager::runs_root(const std::filesystem::path& pictures_root) {
  return pictures_root / kTimelapsesDirName;
}

RunHandle RunDirectoryManager::prepare_run(const RunConfiguration& config,
                                           WallClock::time_point now) const {
  const std::string name = sanitize_experiment_name(config.experiment_name);

  RunHandle h;
  h.directory = runs_root(config.output_directory) / (name + "_" + file_stamp(now));

  std::error_code ec;
  const bool created = std::filesystem::create_directories(h.directory, ec);
  if (ec) {
    throw std::runtime_error("Failed to create run directory " + h.directory.string() + ": " +
                             ec.message());
  }

  h.record.experiment = name;
  h.record.created_at = human_stamp(now);
  h.record.interval_seconds = config.interval_seconds;
  h.record.resolution = config.resolution;
  h.record.total_photos = config.total_shots;
  h.record.folder = h.directory.string();
  h.record.auto_video = config.auto_video;

  h.settings_path = h.directory / kSettingsFileName;
  try {
    write_run_record(h.settings_path, h.record);
  } catch (const std::runtime_error&) {
    if (created) std::filesystem::remove_all(h.directory, ec);
    throw;
  }

  h.log = std::make_shared<RunLog>(h.directory / kRunLogFileName);
  spdlog::info("Prepared run directory {}", h.directory.string());
  return h;
}

void write_run_record(const std::filesystem::path& path, const RunRecord& r) {
  nlohmann::json j{{"experiment", r.experiment},
                   {"created_at", r.created_at},
                   {"interval_seconds", r.interval_seconds},
                   {"resolution", {{"width", r.resolution.width}, {"height", r.resolution.height}}},
                   {"total_photos", r.total_photos},
                   {"folder", r.folder},
                   {"auto_video", r.auto_video}};

  std::ofstream f(path);
  if (!f.is_open()) {
    throw std::runtime_error("Failed to write settings file: " + path.string());
  }
  // Names are user input; invalid UTF-8 is replaced instead of failing the run.
  f << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

RunRecord read_run_record(const std::filesystem::path& run_directory) {
  const auto path = run_directory / kSettingsFileName;
  std::ifstream f(path);
  if (!f.is_open()) {
    throw ConfigurationError("Settings file not found: " + path.string());
  }

  RunRecord r;
  try {
    nlohmann::json j = nlohmann::json::parse(f);
    r.experiment = j.at("experiment").get<std::string>();
    r.created_at = j.at("created_at").get<std::string>();
    r.interval_seconds = j.at("interval_seconds").get<int>();
    r.resolution.width = j.at("resolution").at("width").get<int>();
    r.resolution.height = j.at("resolution").at("height").get<int>();
    r.total_photos = j.at("total_photos").get<int>();
    r.folder = j.at("folder").get<std::string>();
    r.auto_video = j.value("auto_video", false);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError("Malformed settings file " + path.string() + ": " + e.what());
  }
  return r;
}
