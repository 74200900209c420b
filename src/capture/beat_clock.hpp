// src/capture/beat_clock.hpp
// Metronome with a mandatory count-in, driven by look-ahead scheduling.
//
// A poll timer on the event loop wakes every scheduleAheadSeconds * 250 ms and
// enqueues with the audio engine every click whose audio time falls inside the
// look-ahead window. The timer only decides *which* clicks to enqueue; the
// engine decides *when* they sound. nextEventTime advances by exactly one beat
// per click, so a late timer never accumulates drift.
//
// After the last count-in beat is enqueued the clock leaves the count-in,
// resets the beat count and, after a short settle delay, fires the
// count-in-complete callback once. stop() cancels that handoff too.

#pragma once
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "audio/engine.hpp"
#include "capture/beat_indicator.hpp"
#include "core/event_loop.hpp"
#include "midi/tempo.hpp"

namespace capture {

struct ClockConfig {
  double scheduleAheadSeconds = 0.1;
  double handoffDelayMs = 50.0; // count-in end -> recording start
  double flashMs = 150.0;       // how long each beat stays highlighted

  double poll_interval_ms() const { return scheduleAheadSeconds * 250.0; }
};

class BeatClock {
public:
  using Callback = std::function<void()>;

  BeatClock(core::EventLoop &loop, audio::AudioEngine &engine,
            const midi::TempoConfig &tempo, ClockConfig config = {});
  ~BeatClock();

  BeatClock(const BeatClock &) = delete;
  BeatClock &operator=(const BeatClock &) = delete;

  void set_indicator(BeatIndicator *indicator) { indicator_ = indicator; }
  void on_count_in_complete(Callback cb) { onCountInComplete_ = std::move(cb); }

  // Starts the engine (throws audio::AudioEngineError on failure), resets the
  // counters and begins clicking. Restarts cleanly when already playing.
  void start(bool countIn = true);

  // Idempotent. Cancels every pending timer, including the count-in handoff.
  void stop();

  bool is_playing() const { return playing_; }
  bool is_counting_in() const { return countingIn_; }
  unsigned count_in_beat() const { return countInBeat_; }
  unsigned beat_count() const { return beatCount_; }
  double next_event_time() const { return nextEventTime_; }
  const ClockConfig &config() const { return config_; }

private:
  void poll(std::uint64_t generation);
  void schedule_ahead();
  void advance_beat(double beatTime);
  void show_at(double beatTime, unsigned beat, bool countIn);
  void clear_timers();

  core::EventLoop &loop_;
  audio::AudioEngine &engine_;
  const midi::TempoConfig &tempo_;
  ClockConfig config_;
  BeatIndicator *indicator_ = nullptr;
  Callback onCountInComplete_;

  bool playing_ = false;
  bool countingIn_ = false;
  unsigned countInBeat_ = 0;
  unsigned beatCount_ = 0;
  double nextEventTime_ = 0.0;

  // Bumped by every start/stop; timers carrying an older value do nothing.
  std::uint64_t generation_ = 0;
  core::TimerId pollTimer_ = core::kNoTimer;
  core::TimerId handoffTimer_ = core::kNoTimer;
  std::vector<core::TimerId> visualTimers_;
};

} // namespace capture
