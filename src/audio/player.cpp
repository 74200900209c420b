// src/audio/player.cpp
// Turn a decoded SMF into engine-scheduled notes inside a fixed window.

#include "audio/player.hpp"
#include "midi/smf.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace {

// Clip paired notes to [0, window): drop late starters, shorten long tails.
std::vector<audio::PlannedNote> build_plan(const std::vector<midi::Note> &notes,
                                           double window) {
  std::vector<audio::PlannedNote> plan;
  plan.reserve(notes.size());
  for (const auto &n : notes) {
    if (n.start >= window)
      continue;
    plan.push_back(audio::PlannedNote{n.note, n.velocity, n.start,
                                      std::min(n.duration, window - n.start)});
  }
  return plan;
}

} // namespace

namespace audio {

PlaybackScheduler::PlaybackScheduler(core::EventLoop &loop,
                                     AudioEngine &engine,
                                     const midi::TempoConfig &tempo,
                                     PlaybackConfig config)
    : loop_(loop), engine_(engine), tempo_(tempo), config_(config) {}

PlaybackScheduler::~PlaybackScheduler() {
  loop_.clear_timeout(stopTimer_);
  loop_.clear_timeout(loopTimer_);
  release_handles();
}

void PlaybackScheduler::load(const std::vector<std::uint8_t> &bytes,
                             std::optional<double> forcedDuration) {
  stop();
  load_plan(bytes, forcedDuration);
}

void PlaybackScheduler::load_plan(const std::vector<std::uint8_t> &bytes,
                                  std::optional<double> forcedDuration) {
  // Tear down the previous window (a loop iteration restarting lands here).
  release_handles();
  loop_.clear_timeout(stopTimer_);
  stopTimer_ = core::kNoTimer;
  playing_ = false;
  loaded_ = false;
  plan_.clear();

  const double window = forcedDuration.value_or(tempo_.target_duration());
  if (!(window > 0.0)) {
    throw std::invalid_argument("Forced duration must be positive");
  }

  const midi::Song song = midi::decode_smf(bytes, tempo_, true);
  plan_ = build_plan(midi::pair_notes(song.events), window);
  forcedDuration_ = window;
  loaded_ = true;

  spdlog::debug("loaded {} notes ({} in window), file {:.2f}s, window {:.2f}s",
                song.events.size(), plan_.size(), song.length, window);
}

void PlaybackScheduler::start() {
  if (!loaded_ || playing_) {
    spdlog::debug("start ignored: {}", loaded_ ? "already playing" : "nothing loaded");
    return;
  }
  engine_.start();

  ++generation_;
  origin_ = engine_.current_time() + config_.startLeadSeconds;
  handles_.reserve(plan_.size());
  for (const auto &n : plan_) {
    handles_.push_back(
        engine_.schedule_note(origin_ + n.start, n.note, n.velocity, n.sustain));
  }
  playing_ = true;
  paused_ = false;
  arm_stop_timer();

  spdlog::info("playback started, stops at {:.2f}s", forcedDuration_);
}

void PlaybackScheduler::play(const std::vector<std::uint8_t> &bytes,
                             std::optional<double> forcedDuration) {
  load(bytes, forcedDuration);
  start();
}

void PlaybackScheduler::play_with_loop(const std::vector<std::uint8_t> &bytes,
                                       int loopCount,
                                       std::optional<double> forcedDuration) {
  stop();
  if (loopCount == 0 || loopCount < -1) {
    spdlog::debug("loop count {} plays nothing", loopCount);
    finish();
    return;
  }

  loopCancel_ = core::CancellationSource();
  loopSource_ = bytes;
  loopDuration_ = forcedDuration;
  loopCount_ = loopCount;
  loopsStarted_ = 0;
  looping_ = true;
  try {
    // The first window runs right away so decode/engine errors reach the
    // caller instead of the event loop.
    loop_iteration(loopCancel_.token());
  } catch (const std::exception &) {
    looping_ = false;
    loopCancel_.cancel();
    throw;
  }
}

void PlaybackScheduler::stop() {
  loopCancel_.cancel();
  loop_.clear_timeout(loopTimer_);
  loopTimer_ = core::kNoTimer;
  looping_ = false;

  if (!playing_)
    return;

  ++generation_;
  loop_.clear_timeout(stopTimer_);
  stopTimer_ = core::kNoTimer;
  release_handles();
  playing_ = false;

  if (paused_) {
    paused_ = false;
    try {
      engine_.resume();
    } catch (const AudioEngineError &ex) {
      spdlog::error("could not resume audio after stop: {}", ex.what());
    }
  }
  spdlog::info("playback stopped");
}

void PlaybackScheduler::pause() {
  if (!playing_ || paused_)
    return;
  engine_.suspend();
  loop_.clear_timeout(stopTimer_);
  stopTimer_ = core::kNoTimer;
  paused_ = true;
  spdlog::debug("playback paused");
}

void PlaybackScheduler::resume() {
  if (!playing_ || !paused_)
    return;
  engine_.resume();
  paused_ = false;
  arm_stop_timer();
  spdlog::debug("playback resumed");
}

void PlaybackScheduler::arm_stop_timer() {
  // The engine clock froze while paused, so the remaining window is measured
  // on it rather than on the loop's clock.
  const double remaining =
      origin_ + forcedDuration_ - engine_.current_time();
  const std::uint64_t generation = generation_;
  stopTimer_ = loop_.set_timeout(std::max(0.0, remaining * 1000.0),
                                 [this, generation] { end_window(generation); });
}

void PlaybackScheduler::release_handles() {
  for (VoiceHandle h : handles_) {
    engine_.cancel(h);
  }
  handles_.clear();
}

void PlaybackScheduler::end_window(std::uint64_t generation) {
  if (generation != generation_ || !playing_)
    return;
  stopTimer_ = core::kNoTimer;
  ++generation_;
  release_handles();
  playing_ = false;
  spdlog::info("playback stopped at {:.2f}s", forcedDuration_);

  if (!looping_) {
    finish();
    return;
  }
  const core::CancellationToken token = loopCancel_.token();
  loopTimer_ = loop_.set_timeout(config_.loopGapMs, [this, token] {
    loopTimer_ = core::kNoTimer;
    try {
      loop_iteration(token);
    } catch (const std::exception &ex) {
      // Thrown from the event loop: the sequence ends here.
      spdlog::error("loop iteration {} failed: {}", loopsStarted_ + 1,
                    ex.what());
      looping_ = false;
      loopCancel_.cancel();
      finish();
    }
  });
}

void PlaybackScheduler::loop_iteration(core::CancellationToken token) {
  if (token.cancelled())
    return;
  if (loopCount_ != -1 && loopsStarted_ >= loopCount_) {
    spdlog::info("loop sequence completed ({} loops)", loopsStarted_);
    looping_ = false;
    finish();
    return;
  }

  load_plan(loopSource_, loopDuration_);
  start();
  ++loopsStarted_;
}

void PlaybackScheduler::finish() {
  if (onFinished_) {
    onFinished_();
  }
}

} // namespace audio
