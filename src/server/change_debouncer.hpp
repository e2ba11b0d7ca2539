#pragma once

#include "core/dependency_tracker.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string_view>

// Coalesces bursts of filesystem events into at most one rebuild per window.
//
//   Idle -> Collecting -> Deciding -> Triggering -> Idle
//                                  \-> Idle (nothing relevant)
//
// push() may be called from any thread; process_next() and run() belong to
// the single thread that also owns recompilation.
class ChangeDebouncer {
public:
  enum class State { Idle, Collecting, Deciding, Triggering };

  using RelevanceFn = std::function<bool(const FsEvent &)>;
  using TriggerFn = std::function<void()>;

  ChangeDebouncer(std::chrono::milliseconds window, RelevanceFn is_relevant,
                  TriggerFn trigger);

  void push(FsEvent event);

  // Waits for the next burst and handles it. Returns true when it triggered a
  // rebuild, false when the burst was irrelevant or the debouncer stopped.
  bool process_next();

  // Loops over process_next() until stop().
  void run();
  void stop();

  State state() const { return state_.load(); }
  std::size_t pending() const;

private:
  std::chrono::milliseconds window_;
  RelevanceFn is_relevant_;
  TriggerFn trigger_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<FsEvent> events_;
  bool stopped_ = false;
  std::atomic<State> state_{State::Idle};
};

std::string_view to_string(ChangeDebouncer::State state);
