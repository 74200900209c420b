// src/audio/player.hpp
// Forced-duration playback of an SMF against the shared audio engine.
//
// Public API:
//   PlaybackScheduler player(loop, engine, tempo);
//   player.play(bytes);              // load + start, stops at 9.6 s
//   player.play_with_loop(bytes, 3); // three windows, 50 ms apart
//   player.stop();
//
// Design notes:
// - Notes are handed to the engine up front with exact engine times; the
//   event loop only carries the stop event that closes the window.
// - The window length never comes from the file. Notes starting at or after
//   it are dropped, the rest are clamped so start + sustain fits inside.
// - Looping runs as a cancellable task: stop() cancels its token, and every
//   iteration checks the token before doing anything.

#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "audio/engine.hpp"
#include "core/cancellation.hpp"
#include "core/event_loop.hpp"
#include "midi/tempo.hpp"

namespace audio {

struct PlaybackConfig {
  double loopGapMs = 50.0;       // silence between loop iterations
  double startLeadSeconds = 0.05; // transport origin ahead of "now"
};

// A note as it will be handed to the engine, relative to the transport origin.
struct PlannedNote {
  std::uint8_t note = 0;
  std::uint8_t velocity = 0;
  double start = 0.0;
  double sustain = 0.0;
};

class PlaybackScheduler {
public:
  PlaybackScheduler(core::EventLoop &loop, AudioEngine &engine,
                    const midi::TempoConfig &tempo, PlaybackConfig config = {});
  ~PlaybackScheduler();

  PlaybackScheduler(const PlaybackScheduler &) = delete;
  PlaybackScheduler &operator=(const PlaybackScheduler &) = delete;

  // Runs when playback ends on its own (last window of a loop, or the only
  // window of a plain play).
  void on_finished(std::function<void()> cb) { onFinished_ = std::move(cb); }

  // Cancel whatever is playing, decode `bytes` and plan the notes.
  // forcedDuration defaults to the tempo's target duration.
  // Throws midi::MalformedFileError (nothing is planned then) and
  // std::invalid_argument for a non-positive duration.
  void load(const std::vector<std::uint8_t> &bytes,
            std::optional<double> forcedDuration = std::nullopt);

  // Hand the planned notes to the engine and arm the stop event.
  // Throws AudioEngineError when the engine cannot start.
  void start();

  void play(const std::vector<std::uint8_t> &bytes,
            std::optional<double> forcedDuration = std::nullopt);

  // loopCount == -1 repeats until stop(). A count that plays nothing finishes
  // at once. A later iteration that fails to load or start ends the sequence
  // and still reports it finished.
  void play_with_loop(const std::vector<std::uint8_t> &bytes,
                      int loopCount = -1,
                      std::optional<double> forcedDuration = std::nullopt);

  // Idempotent: halts the transport, cancels every handle and any loop.
  void stop();

  void pause();
  void resume();

  bool is_playing() const { return playing_; }
  bool is_paused() const { return paused_; }
  bool is_looping() const { return looping_; }
  double forced_duration() const { return forcedDuration_; }
  double transport_origin() const { return origin_; }
  const std::vector<PlannedNote> &plan() const { return plan_; }
  std::size_t scheduled_count() const { return handles_.size(); }
  int loops_started() const { return loopsStarted_; }

private:
  void load_plan(const std::vector<std::uint8_t> &bytes,
                 std::optional<double> forcedDuration);
  void arm_stop_timer();
  void release_handles();
  void end_window(std::uint64_t generation);
  void loop_iteration(core::CancellationToken token);
  void finish();

  core::EventLoop &loop_;
  AudioEngine &engine_;
  const midi::TempoConfig &tempo_;
  PlaybackConfig config_;
  std::function<void()> onFinished_;

  std::vector<PlannedNote> plan_;
  bool loaded_ = false;
  double forcedDuration_ = 0.0;

  bool playing_ = false;
  bool paused_ = false;
  double origin_ = 0.0; // engine time of transport zero
  std::vector<VoiceHandle> handles_;
  std::uint64_t generation_ = 0;
  core::TimerId stopTimer_ = core::kNoTimer;

  // Looping task
  bool looping_ = false;
  int loopCount_ = -1;
  int loopsStarted_ = 0;
  std::vector<std::uint8_t> loopSource_;
  std::optional<double> loopDuration_;
  core::CancellationSource loopCancel_;
  core::TimerId loopTimer_ = core::kNoTimer;
};

} // namespace audio
