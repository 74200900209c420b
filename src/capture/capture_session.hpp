// src/capture/capture_session.hpp
// One take, start to finish: count-in -> recording -> stopped (or canceled).
//
// All side effects of a state change (starting or stopping the metronome,
// starting, stopping or canceling the recorder) live in transition(), so
// callers never have to remember which timers to clear.
//
//   Idle ──begin──▶ CountingIn ──count-in done──▶ Recording ──finish/timer──▶ Stopped
//                        │                            │
//                        └──────────cancel────────────┴──▶ Canceled
//
// begin() is also accepted from Stopped and Canceled and starts a new take.

#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "capture/beat_clock.hpp"
#include "capture/recorder.hpp"
#include "core/event_loop.hpp"
#include "midi/smf.hpp"

namespace capture {

enum class SessionState { Idle, CountingIn, Recording, Stopped, Canceled };

const char *to_string(SessionState state);

class CaptureSession {
public:
  using StateCallback = std::function<void(SessionState)>;

  CaptureSession(core::EventLoop &loop, BeatClock &clock,
                 NoteEventRecorder &recorder, const midi::TempoConfig &tempo);

  CaptureSession(const CaptureSession &) = delete;
  CaptureSession &operator=(const CaptureSession &) = delete;

  void on_state_change(StateCallback cb) { onStateChange_ = std::move(cb); }

  // Start a take. Ignored while a take is counting in or recording.
  // Engine failures propagate (audio::AudioEngineError) and leave the session
  // where it was.
  void begin(RecordMode mode, double durationSeconds, bool countIn = true);

  // Live input, timestamped on the event loop's clock. Dropped unless
  // recording.
  void note_on(int note, int velocity);
  void note_off(int note, int velocity = 0);

  // End the take now. Returns the captured events (empty unless recording).
  std::vector<midi::NoteEvent> finish();

  // Abort from count-in or recording; the take's events are discarded.
  void cancel();

  // Encoded SMF of the finished take, or nullopt unless Stopped.
  // Throws midi::EmptyCaptureError when the take holds no notes.
  std::optional<std::vector<std::uint8_t>>
  export_file(midi::EncodeMode mode = midi::EncodeMode::Export) const;

  SessionState state() const { return state_; }

private:
  void transition(SessionState next);

  core::EventLoop &loop_;
  BeatClock &clock_;
  NoteEventRecorder &recorder_;
  const midi::TempoConfig &tempo_;
  StateCallback onStateChange_;

  SessionState state_ = SessionState::Idle;
  RecordMode mode_ = RecordMode::FixedDuration;
  double durationSeconds_ = 0.0;
};

} // namespace capture
