#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

#include "scheduler.hpp"
#include "types.hpp"

struct ReportEvent {
  enum class Kind { Log, Progress, Finished, Error };

  Kind kind{Kind::Log};
  std::string message;  // Log, Error
  int current{0};       // Progress
  int total{0};         // Progress
  SchedulerState state{SchedulerState::Idle};  // Finished
  uint64_t seq{0};
};

// Consumer side of the channel. Called on the observer's thread only.
class RunObserver {
public:
  virtual ~RunObserver() = default;
  virtual void on_log(const std::string& message) = 0;
  virtual void on_progress(int current, int total) = 0;
  virtual void on_finished(SchedulerState state) = 0;
  // Fatal errors that need the operator's attention (e.g. video assembly failed).
  virtual void on_error(const std::string& message) = 0;
};

// Multi-producer, single-consumer event channel between the scheduler thread and the observer
// context. Posting never waits on the consumer and never drops; delivery follows post order.
class Reporter {
public:
  void post_log(const std::string& message);
  void post_progress(int current, int total);
  void post_finished(SchedulerState state);
  void post_error(const std::string& message);

  // Delivers everything queued so far. Returns the number of events delivered.
  size_t dispatch(RunObserver& observer);
  // Waits up to `timeout` for at least one event, then dispatches.
  size_t wait_and_dispatch(RunObserver& observer, std::chrono::milliseconds timeout);

  size_t pending() const;

  // Scheduler callbacks that forward into this channel. Capture and on_attempt are left unset.
  SchedulerCallbacks callbacks();

private:
  void post(ReportEvent ev);
  static void deliver(RunObserver& observer, const ReportEvent& ev);

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<ReportEvent> queue_;
  uint64_t next_seq_{0};
};
