#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using WallClock = std::chrono::system_clock;

struct Resolution {
  int width{2028};
  int height{1520};

  bool operator==(const Resolution& o) const { return width == o.width && height == o.height; }
  bool operator!=(const Resolution& o) const { return !(*this == o); }
};

// Parses "2028x1520" or "2028 x 1520". Throws ConfigurationError.
Resolution parse_resolution(const std::string& text);
std::string to_string(const Resolution& r);

struct RunConfiguration {
  std::string experiment_name{"timelapse"};
  int interval_seconds{300};
  int total_shots{144};
  Resolution resolution{};
  bool auto_video{false};
  std::filesystem::path output_directory;  // pictures root; "Timelapses/" is appended
};

// Upper bound on interval_seconds * total_shots (ten years). Every shot target then stays
// well inside the range of Clock::duration.
constexpr long long kMaxRunSeconds = 10LL * 366 * 24 * 3600;

// Converts a minute count to interval seconds. Throws ConfigurationError when the result
// does not fit in an int.
int interval_from_minutes(long long minutes);

// Rejects non-positive interval/count/resolution, runs longer than kMaxRunSeconds, and
// resolutions outside `allowed` when that list is non-empty. Throws ConfigurationError.
void validate_run_configuration(const RunConfiguration& cfg,
                                const std::vector<Resolution>& allowed = {});

enum class SchedulerState { Idle, Running, CancelRequested, Finished, Cancelled };

const char* to_string(SchedulerState s);

struct CaptureOutcome {
  bool success{false};
  double elapsed_seconds{0};
  std::string reason;

  static CaptureOutcome ok(double elapsed) { return {true, elapsed, {}}; }
  static CaptureOutcome failed(std::string why, double elapsed = 0) {
    return {false, elapsed, std::move(why)};
  }
};

struct CaptureAttempt {
  int sequence_number{0};
  TimePoint scheduled_time{};
  std::string filename;
  CaptureOutcome outcome{};
};
