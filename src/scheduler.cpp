#include "scheduler.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

#include "errors.hpp"

std::string capture_filename(WallClock::time_point t, int sequence) {
  return fmt::format("{}_{:05d}.jpg", utc_file_stamp(t), sequence);
}

AcquisitionScheduler::AcquisitionScheduler(std::shared_ptr<SchedulerClock> clock,
                                           Clock::duration poll_slice)
    : clock_(clock ? std::move(clock) : std::make_shared<SteadySchedulerClock>()),
      poll_slice_(poll_slice) {}

AcquisitionScheduler::~AcquisitionScheduler() {
  cancel();
  wait();
}

bool AcquisitionScheduler::start(ScheduleRequest req, SchedulerCallbacks cb) {
  if (req.total_shots > 0 && req.interval.count() > kMaxRunSeconds / req.total_shots) {
    throw ConfigurationError(fmt::format("Run too long: {} photos every {}s", req.total_shots,
                                         req.interval.count()));
  }

  std::lock_guard<std::mutex> g(start_mu_);
  if (active_.exchange(true)) return false;

  // The previous loop has already returned; reclaim its thread.
  if (loop_thread_.joinable()) loop_thread_.join();

  cancel_ = false;
  completed_ = 0;
  state_ = SchedulerState::Running;
  loop_thread_ = std::thread(&AcquisitionScheduler::run_loop, this, std::move(req), std::move(cb));
  return true;
}

void AcquisitionScheduler::cancel() {
  auto expected = SchedulerState::Running;
  if (state_.compare_exchange_strong(expected, SchedulerState::CancelRequested)) {
    cancel_ = true;
  }
}

void AcquisitionScheduler::wait() {
  std::lock_guard<std::mutex> g(start_mu_);
  if (loop_thread_.joinable()) loop_thread_.join();
}

bool AcquisitionScheduler::wait_until(TimePoint target) {
  for (;;) {
    if (cancel_requested()) return false;
    const auto now = clock_->now();
    if (now >= target) return true;
    clock_->sleep_for(std::min<Clock::duration>(poll_slice_, target - now));
  }
}

void AcquisitionScheduler::emit(const ScheduleRequest& req, const SchedulerCallbacks& cb,
                                const std::string& line) {
  if (req.run_log) req.run_log->write(line);
  if (cb.on_log) cb.on_log(line);
}

void AcquisitionScheduler::run_loop(ScheduleRequest req, SchedulerCallbacks cb) {
  const int total = req.total_shots;
  const TimePoint start = clock_->now();
  bool cancelled = false;

  emit(req, cb, fmt::format("Start acquisition of {} photos", total));

  for (int i = 1; i <= total; ++i) {
    if (cancel_requested() || !wait_until(start + i * req.interval)) {
      cancelled = true;
      break;
    }

    CaptureAttempt attempt;
    attempt.sequence_number = i;
    attempt.scheduled_time = start + i * req.interval;
    attempt.filename = capture_filename(WallClock::now(), i);

    const auto t0 = clock_->now();
    try {
      attempt.outcome = cb.capture(i, req.output_dir / attempt.filename);
    } catch (const std::exception& e) {
      attempt.outcome = CaptureOutcome::failed(e.what());
    }
    attempt.outcome.elapsed_seconds =
        std::chrono::duration<double>(clock_->now() - t0).count();

    if (attempt.outcome.success) {
      emit(req, cb,
           fmt::format("OK  {}  {:.2f}s", attempt.filename, attempt.outcome.elapsed_seconds));
    } else {
      emit(req, cb, fmt::format("ERROR  {}  {}", attempt.filename, attempt.outcome.reason));
    }
    if (cb.on_attempt) cb.on_attempt(attempt);

    completed_ = i;
    if (cb.on_progress) cb.on_progress(i, total);
  }

  if (cancelled) {
    emit(req, cb, fmt::format("Acquisition cancelled after {} of {} photos", completed_.load(),
                              total));
  }

  const auto final_state = cancelled ? SchedulerState::Cancelled : SchedulerState::Finished;
  state_ = final_state;
  emit(req, cb, "End of acquisition");
  spdlog::debug("Scheduler loop exited ({})", to_string(final_state));

  if (cb.on_complete) cb.on_complete(final_state);
  active_ = false;
}
