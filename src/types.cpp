#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

#include "errors.hpp"

Resolution parse_resolution(const std::string& text) {
  std::string s;
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) s += static_cast<char>(std::tolower(c));
  }
  const auto x = s.find('x');
  if (x == std::string::npos || x == 0 || x + 1 >= s.size()) {
    throw ConfigurationError("Invalid resolution '" + text + "' (expected WIDTHxHEIGHT)");
  }
  Resolution r{};
  try {
    size_t used_w = 0, used_h = 0;
    r.width = std::stoi(s.substr(0, x), &used_w);
    r.height = std::stoi(s.substr(x + 1), &used_h);
    if (used_w != x || used_h != s.size() - x - 1) throw std::invalid_argument("trailing");
  } catch (const std::exception&) {
    throw ConfigurationError("Invalid resolution '" + text + "' (expected WIDTHxHEIGHT)");
  }
  return r;
}

std::string to_string(const Resolution& r) {
  return std::to_string(r.width) + "x" + std::to_string(r.height);
}

int interval_from_minutes(long long minutes) {
  constexpr long long kMax = std::numeric_limits<int>::max() / 60;
  constexpr long long kMin = std::numeric_limits<int>::min() / 60;
  if (minutes > kMax || minutes < kMin) {
    throw ConfigurationError("Invalid interval: " + std::to_string(minutes) + " minutes.");
  }
  return static_cast<int>(minutes * 60);
}

void validate_run_configuration(const RunConfiguration& cfg,
                                const std::vector<Resolution>& allowed) {
  if (cfg.total_shots <= 0) throw ConfigurationError("Invalid number of photos.");
  if (cfg.interval_seconds <= 0) throw ConfigurationError("Invalid interval.");
  if (static_cast<long long>(cfg.interval_seconds) * cfg.total_shots > kMaxRunSeconds) {
    throw ConfigurationError("Run too long: interval x photos exceeds " +
                             std::to_string(kMaxRunSeconds / 86400) + " days.");
  }
  if (cfg.resolution.width <= 0 || cfg.resolution.height <= 0) {
    throw ConfigurationError("Invalid resolution.");
  }
  if (!allowed.empty() &&
      std::find(allowed.begin(), allowed.end(), cfg.resolution) == allowed.end()) {
    throw ConfigurationError("Unsupported resolution " + to_string(cfg.resolution) + ".");
  }
  if (cfg.output_directory.empty()) throw ConfigurationError("Missing output directory.");
}

const char* to_string(SchedulerState s) {
  switch (s) {
    case SchedulerState::Idle:
      return "idle";
    case SchedulerState::Running:
      return "running";
    case SchedulerState::CancelRequested:
      return "cancel_requested";
    case SchedulerState::Finished:
      return "finished";
    case SchedulerState::Cancelled:
      return "cancelled";
  }
  return "idle";
}
