#include "metrics.hpp"
#include <sstream>

CaptureStats CaptureMetrics::snapshot() const {
  CaptureStats s{};
  s.capture_p50 = capture_ms_.perc(50);
  s.capture_p95 = capture_ms_.perc(95);
  s.capture_p99 = capture_ms_.perc(99);
  s.shots_total = shots_total_.load();
  s.failures_total = failures_total_.load();
  s.runs_total = runs_total_.load();
  s.failure_rate = s.shots_total ? static_cast<double>(s.failures_total) /
                                       static_cast<double>(s.shots_total)
                                 : 0.0;
  return s;
}

std::string CaptureMetrics::prometheus_text(const CaptureStats& s) const {
  std::ostringstream os;
  os << "capture_duration_ms{quantile=\"0.5\"} "  << s.capture_p50 << "\n";
  os << "capture_duration_ms{quantile=\"0.95\"} " << s.capture_p95 << "\n";
  os << "capture_duration_ms{quantile=\"0.99\"} " << s.capture_p99 << "\n";

  os << "capture_shots_total " << s.shots_total << "\n";
  os << "capture_failures_total " << s.failures_total << "\n";
  os << "capture_failure_rate " << s.failure_rate << "\n";
  os << "acquisition_runs_total " << s.runs_total << "\n";
  return os.str();
}
