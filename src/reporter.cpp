#include "reporter.hpp"

#include <utility>

void Reporter::post(ReportEvent ev) {
  {
    std::lock_guard<std::mutex> g(mu_);
    ev.seq = next_seq_++;
    queue_.push_back(std::move(ev));
  }
  cv_.notify_one();
}

void Reporter::post_log(const std::string& message) {
  ReportEvent ev;
  ev.kind = ReportEvent::Kind::Log;
  ev.message = message;
  post(std::move(ev));
}

void Reporter::post_progress(int current, int total) {
  ReportEvent ev;
  ev.kind = ReportEvent::Kind::Progress;
  ev.current = current;
  ev.total = total;
  post(std::move(ev));
}

void Reporter::post_finished(SchedulerState state) {
  ReportEvent ev;
  ev.kind = ReportEvent::Kind::Finished;
  ev.state = state;
  post(std::move(ev));
}

void Reporter::post_error(const std::string& message) {
  ReportEvent ev;
  ev.kind = ReportEvent::Kind::Error;
  ev.message = message;
  post(std::move(ev));
}

void Reporter::deliver(RunObserver& observer, const ReportEvent& ev) {
  switch (ev.kind) {
    case ReportEvent::Kind::Log:
      observer.on_log(ev.message);
      break;
    case ReportEvent::Kind::Progress:
      observer.on_progress(ev.current, ev.total);
      break;
    case ReportEvent::Kind::Finished:
      observer.on_finished(ev.state);
      break;
    case ReportEvent::Kind::Error:
      observer.on_error(ev.message);
      break;
  }
}

size_t Reporter::dispatch(RunObserver& observer) {
  std::deque<ReportEvent> batch;
  {
    std::lock_guard<std::mutex> g(mu_);
    batch.swap(queue_);
  }
  // Delivered outside the lock so a slow observer never holds up producers.
  for (const auto& ev : batch) deliver(observer, ev);
  return batch.size();
}

size_t Reporter::wait_and_dispatch(RunObserver& observer, std::chrono::milliseconds timeout) {
  {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [this] { return !queue_.empty(); });
  }
  return dispatch(observer);
}

size_t Reporter::pending() const {
  std::lock_guard<std::mutex> g(mu_);
  return queue_.size();
}

SchedulerCallbacks Reporter::callbacks() {
  SchedulerCallbacks cb;
  cb.on_log = [this](const std::string& m) { post_log(m); };
  cb.on_progress = [this](int c, int t) { post_progress(c, t); };
  cb.on_complete = [this](SchedulerState s) { post_finished(s); };
  return cb;
}
