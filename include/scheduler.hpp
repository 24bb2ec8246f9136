#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "run_directory.hpp"
#include "types.hpp"

// Monotonic time source for the scheduler. Injected so tests can run without real waits.
class SchedulerClock {
public:
  virtual ~SchedulerClock() = default;
  virtual TimePoint now() = 0;
  virtual void sleep_for(Clock::duration d) = 0;
};

class SteadySchedulerClock : public SchedulerClock {
public:
  TimePoint now() override { return Clock::now(); }
  void sleep_for(Clock::duration d) override { std::this_thread::sleep_for(d); }
};

using CaptureFn = std::function<CaptureOutcome(int sequence, const std::filesystem::path& dest)>;

struct SchedulerCallbacks {
  CaptureFn capture;
  std::function<void(int current, int total)> on_progress;
  std::function<void(const std::string& message)> on_log;
  std::function<void(const CaptureAttempt& attempt)> on_attempt;
  std::function<void(SchedulerState final_state)> on_complete;
};

struct ScheduleRequest {
  int total_shots{0};
  std::chrono::seconds interval{0};
  std::filesystem::path output_dir;
  std::shared_ptr<RunLog> run_log;  // optional
};

constexpr std::chrono::milliseconds kDefaultPollSlice{500};

// Drives `total_shots` captures on a background thread. Shot i fires at start + i*interval;
// a slow capture never shifts later targets, it only makes the next shot fire immediately.
// Cancellation is polled between wait slices and is not observed during a capture call.
class AcquisitionScheduler {
public:
  explicit AcquisitionScheduler(std::shared_ptr<SchedulerClock> clock = nullptr,
                                Clock::duration poll_slice = kDefaultPollSlice);
  ~AcquisitionScheduler();
  AcquisitionScheduler(const AcquisitionScheduler&) = delete;
  AcquisitionScheduler& operator=(const AcquisitionScheduler&) = delete;

  // Returns false without side effects if a run is still active. Throws ConfigurationError
  // if total_shots * interval exceeds kMaxRunSeconds.
  bool start(ScheduleRequest req, SchedulerCallbacks cb);
  void cancel();
  // Blocks until the background thread has exited.
  void wait();

  SchedulerState state() const { return state_.load(); }
  // True until the loop thread returns, including the completion callback.
  bool active() const { return active_.load(); }
  int completed_shots() const { return completed_.load(); }

private:
  void run_loop(ScheduleRequest req, SchedulerCallbacks cb);
  bool wait_until(TimePoint target);
  bool cancel_requested() const { return cancel_.load(); }
  void emit(const ScheduleRequest& req, const SchedulerCallbacks& cb, const std::string& line);

  std::shared_ptr<SchedulerClock> clock_;
  Clock::duration poll_slice_;

  std::mutex start_mu_;
  std::atomic<SchedulerState> state_{SchedulerState::Idle};
  std::atomic<bool> cancel_{false};
  std::atomic<bool> active_{false};
  std::atomic<int> completed_{0};
  std::thread loop_thread_;
};

// "<YYYYmmdd_HHMMSS>_<sequence padded to 5>.jpg", stamp in UTC
std::string capture_filename(WallClock::time_point t, int sequence);
