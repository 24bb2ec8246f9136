#include "observers.hpp"

#include <spdlog/spdlog.h>

#include <vector>

void ConsoleObserver::on_log(const std::string& message) { spdlog::info("{}", message); }

void ConsoleObserver::on_progress(int current, int total) {
  spdlog::info("{}/{} photos taken.", current, total);
}

void ConsoleObserver::on_finished(SchedulerState state) {
  final_state_ = state;
  finished_ = true;
  spdlog::info("{}", state == SchedulerState::Finished ? "Finished." : "Stopped.");
}

void ConsoleObserver::on_error(const std::string& message) {
  errors_++;
  spdlog::error("{}", message);
}

void StatusBoard::on_log(const std::string& message) {
  std::lock_guard<std::mutex> g(mu_);
  if (log_.size() == max_log_lines_) log_.pop_front();
  log_.push_back(message);
}

void StatusBoard::on_progress(int current, int total) {
  std::lock_guard<std::mutex> g(mu_);
  current_ = current;
  total_ = total;
  status_ = std::to_string(current) + "/" + std::to_string(total) + " photos taken.";
}

void StatusBoard::on_finished(SchedulerState state) {
  std::lock_guard<std::mutex> g(mu_);
  status_ = state == SchedulerState::Finished ? "Finished." : "Stopped.";
}

void StatusBoard::on_error(const std::string& message) {
  std::lock_guard<std::mutex> g(mu_);
  last_error_ = message;
  if (log_.size() == max_log_lines_) log_.pop_front();
  log_.push_back("ERROR " + message);
}

void StatusBoard::reset(int total) {
  std::lock_guard<std::mutex> g(mu_);
  current_ = 0;
  total_ = total;
  status_ = "Starting...";
  last_error_.clear();
}

nlohmann::json StatusBoard::to_json() const {
  std::lock_guard<std::mutex> g(mu_);
  return nlohmann::json{{"current", current_},
                        {"total", total_},
                        {"status", status_},
                        {"last_error", last_error_},
                        {"log", nlohmann::json(std::vector<std::string>(log_.begin(), log_.end()))}};
}

std::string StatusBoard::status_text() const {
  std::lock_guard<std::mutex> g(mu_);
  return status_;
}
