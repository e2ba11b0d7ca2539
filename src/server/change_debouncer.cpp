#include "change_debouncer.hpp"
#include "utils/log.hpp"
#include <iostream>

std::string_view to_string(ChangeDebouncer::State state) {
  switch (state) {
  case ChangeDebouncer::State::Collecting:
    return "collecting";
  case ChangeDebouncer::State::Deciding:
    return "deciding";
  case ChangeDebouncer::State::Triggering:
    return "triggering";
  case ChangeDebouncer::State::Idle:
    break;
  }
  return "idle";
}

ChangeDebouncer::ChangeDebouncer(std::chrono::milliseconds window,
                                 RelevanceFn is_relevant, TriggerFn trigger)
    : window_(window), is_relevant_(std::move(is_relevant)),
      trigger_(std::move(trigger)) {}

void ChangeDebouncer::push(FsEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(std::move(event));
  }
  cv_.notify_all();
}

std::size_t ChangeDebouncer::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

bool ChangeDebouncer::process_next() {
  std::deque<FsEvent> batch;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    state_ = State::Idle;
    cv_.wait(lock, [this] { return stopped_ || !events_.empty(); });
    if (stopped_) {
      return false;
    }

    // The window is fixed from the first event; later events do not extend it.
    state_ = State::Collecting;
    auto deadline = std::chrono::steady_clock::now() + window_;
    if (cv_.wait_until(lock, deadline, [this] { return stopped_; })) {
      state_ = State::Idle;
      return false;
    }

    batch.swap(events_);
  }

  state_ = State::Deciding;
  std::size_t relevant = 0;
  for (const FsEvent &event : batch) {
    if (is_relevant_(event)) {
      ++relevant;
    }
  }

  if (relevant == 0) {
    state_ = State::Idle;
    return false;
  }

  log_time(std::cout) << termcolor::bright_cyan << "📝 " << relevant << " of "
                      << batch.size()
                      << (batch.size() == 1 ? " change" : " changes")
                      << " relevant" << termcolor::reset << "\n";

  state_ = State::Triggering;
  trigger_();
  state_ = State::Idle;
  return true;
}

void ChangeDebouncer::run() {
  while (true) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopped_) {
        return;
      }
    }
    process_next();
  }
}

void ChangeDebouncer::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
}
