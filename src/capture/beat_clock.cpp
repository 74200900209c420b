// src/capture/beat_clock.cpp

#include "capture/beat_clock.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace capture {

BeatClock::BeatClock(core::EventLoop &loop, audio::AudioEngine &engine,
                     const midi::TempoConfig &tempo, ClockConfig config)
    : loop_(loop), engine_(engine), tempo_(tempo), config_(config) {}

BeatClock::~BeatClock() { clear_timers(); }

void BeatClock::start(bool countIn) {
  if (playing_) {
    stop();
  }
  midi::validate(tempo_);
  engine_.start();

  ++generation_;
  beatCount_ = 0;
  countInBeat_ = 0;
  countingIn_ = countIn && tempo_.countInBeats > 0;
  playing_ = true;
  nextEventTime_ = engine_.current_time();

  spdlog::info("metronome started at {} BPM{}", tempo_.bpm,
               countingIn_ ? " with count-in" : "");
  poll(generation_);
}

void BeatClock::stop() {
  if (!playing_)
    return;

  ++generation_;
  playing_ = false;
  countingIn_ = false;
  clear_timers();

  if (indicator_) {
    indicator_->reset();
  }
  spdlog::info("metronome stopped");
}

void BeatClock::poll(std::uint64_t generation) {
  if (generation != generation_ || !playing_)
    return;
  pollTimer_ = core::kNoTimer;

  schedule_ahead();

  // Drop ids of visual timers that already fired.
  visualTimers_.erase(std::remove_if(visualTimers_.begin(), visualTimers_.end(),
                                     [this](core::TimerId id) {
                                       return !loop_.pending(id);
                                     }),
                      visualTimers_.end());

  if (playing_) {
    pollTimer_ = loop_.set_timeout(config_.poll_interval_ms(),
                                   [this, generation] { poll(generation); });
  }
}

void BeatClock::schedule_ahead() {
  const double horizon = engine_.current_time() + config_.scheduleAheadSeconds;
  while (nextEventTime_ < horizon) {
    const double beatTime = nextEventTime_;
    engine_.schedule_click(beatTime, countingIn_);
    advance_beat(beatTime);
  }
}

void BeatClock::advance_beat(double beatTime) {
  nextEventTime_ += tempo_.seconds_per_beat();

  if (!countingIn_) {
    ++beatCount_;
    show_at(beatTime, beatCount_, false);
    return;
  }

  ++countInBeat_;
  show_at(beatTime, countInBeat_, true);
  if (countInBeat_ < tempo_.countInBeats)
    return;

  countingIn_ = false;
  beatCount_ = 0;
  const std::uint64_t generation = generation_;
  handoffTimer_ = loop_.set_timeout(config_.handoffDelayMs, [this, generation] {
    if (generation != generation_ || !playing_)
      return;
    handoffTimer_ = core::kNoTimer;
    spdlog::debug("count-in complete");
    if (onCountInComplete_) {
      onCountInComplete_();
    }
  });
}

void BeatClock::show_at(double beatTime, unsigned beat, bool countIn) {
  if (!indicator_)
    return;
  const double delayMs =
      std::max(0.0, (beatTime - engine_.current_time()) * 1000.0);
  const std::uint64_t generation = generation_;
  visualTimers_.push_back(
      loop_.set_timeout(delayMs, [this, generation, beat, countIn] {
        if (generation != generation_ || !indicator_)
          return;
        indicator_->show_beat(beat, countIn);
        visualTimers_.push_back(
            loop_.set_timeout(config_.flashMs, [this, generation] {
              if (generation == generation_ && indicator_) {
                indicator_->clear_flash();
              }
            }));
      }));
}

void BeatClock::clear_timers() {
  loop_.clear_timeout(pollTimer_);
  loop_.clear_timeout(handoffTimer_);
  pollTimer_ = core::kNoTimer;
  handoffTimer_ = core::kNoTimer;
  for (core::TimerId id : visualTimers_) {
    loop_.clear_timeout(id);
  }
  visualTimers_.clear();
}

} // namespace capture
