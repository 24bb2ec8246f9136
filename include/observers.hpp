#pragma once
#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "reporter.hpp"
#include "types.hpp"

// Foreground observer for the `run` subcommand: mirrors events to the application log.
class ConsoleObserver : public RunObserver {
public:
  void on_log(const std::string& message) override;
  void on_progress(int current, int total) override;
  void on_finished(SchedulerState state) override;
  void on_error(const std::string& message) override;

  bool finished() const { return finished_.load(); }
  SchedulerState final_state() const { return final_state_.load(); }
  int errors() const { return errors_.load(); }

private:
  std::atomic<bool> finished_{false};
  std::atomic<SchedulerState> final_state_{SchedulerState::Idle};
  std::atomic<int> errors_{0};
};

// Latest run status for the HTTP API. Written by the observer thread, read by request handlers.
class StatusBoard : public RunObserver {
public:
  explicit StatusBoard(size_t max_log_lines = 200) : max_log_lines_(max_log_lines) {}

  void on_log(const std::string& message) override;
  void on_progress(int current, int total) override;
  void on_finished(SchedulerState state) override;
  void on_error(const std::string& message) override;

  // A new run was started from the API; resets progress and status text.
  void reset(int total);

  nlohmann::json to_json() const;
  std::string status_text() const;

private:
  mutable std::mutex mu_;
  size_t max_log_lines_;
  std::deque<std::string> log_;
  int current_{0};
  int total_{0};
  std::string status_{"Waiting..."};
  std::string last_error_;
};
