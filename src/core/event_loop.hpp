// src/core/event_loop.hpp
// Single-threaded cooperative timer queue.
//
// Everything above the audio device runs here: metronome polling, recording
// timeouts, playback stop events. Timers are advisory (they decide what to
// enqueue with the audio engine), so millisecond resolution is plenty.
//
// Contract:
//  - set_timeout() never fires synchronously; the callback runs from a later
//    run_due() at or after its deadline.
//  - clear_timeout() on a fired or unknown id is a harmless no-op.
//  - A callback that throws is logged and dropped; the exception never
//    escapes run_due().

#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <utility>

#include "core/time_source.hpp"

namespace core {

using TimerId = std::uint64_t;
constexpr TimerId kNoTimer = 0;

class EventLoop {
public:
  using Callback = std::function<void()>;

  explicit EventLoop(const TimeSource &time) : time_(time) {}

  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  double now_ms() const { return time_.now_ms(); }

  TimerId set_timeout(double delayMs, Callback cb);
  // Returns true when a pending timer was removed.
  bool clear_timeout(TimerId id);
  bool pending(TimerId id) const;
  std::size_t pending_count() const { return index_.size(); }

  // Deadline of the earliest pending timer, if any.
  std::optional<double> next_deadline() const;

  // Fire every timer whose deadline has passed, in deadline order (ties in
  // creation order). Timers armed by a callback that are already due fire in
  // the same pass. Returns the number of callbacks run.
  std::size_t run_due();

  // Block the calling thread, firing timers as they come due, until
  // `keepGoing` returns false. `idleMs` caps each sleep so external input can
  // be noticed.
  void run(const std::function<bool()> &keepGoing, double idleMs = 5.0);

private:
  // (deadline, sequence) orders timers; sequence breaks ties FIFO.
  using Key = std::pair<double, TimerId>;

  const TimeSource &time_;
  std::map<Key, Callback> queue_;
  std::map<TimerId, Key> index_;
  TimerId nextId_ = 1;
};

} // namespace core
