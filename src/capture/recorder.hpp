// src/capture/recorder.hpp
// Captures note on/off events with session-relative timestamps.
//
// Two stopping policies:
//  - FixedDuration : one timer stops the session after `duration` seconds.
//  - SilenceTimeout: every note-on re-arms an inactivity timer; when it runs
//                    out the session stops by itself.
//
// Lifecycle: Idle -> Recording -> Stopped | Canceled. Only a Stopped session
// hands out its events for export. A canceled session has no events at all.
// Timestamps are milliseconds on the event loop's clock.

#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "core/event_loop.hpp"
#include "midi/events.hpp"

namespace capture {

enum class RecordMode { FixedDuration, SilenceTimeout };

enum class RecorderState { Idle, Recording, Stopped, Canceled };

struct RecorderConfig {
  double silenceTimeoutMs = 2000.0;
};

struct RecordingSession {
  RecordMode mode = RecordMode::FixedDuration;
  double startTimestamp = 0.0; // ms, event-loop clock
  std::vector<midi::NoteEvent> events; // arrival order
  double durationBound = 0.0;         // seconds (FixedDuration only)
  bool canceled = false;
};

class NoteEventRecorder {
public:
  using StoppedCallback = std::function<void(const std::vector<midi::NoteEvent> &)>;

  explicit NoteEventRecorder(core::EventLoop &loop, RecorderConfig config = {});
  ~NoteEventRecorder();

  NoteEventRecorder(const NoteEventRecorder &) = delete;
  NoteEventRecorder &operator=(const NoteEventRecorder &) = delete;

  // Called when a timer (duration or silence) ends the session.
  void on_auto_stop(StoppedCallback cb) { onAutoStop_ = std::move(cb); }

  // Throws std::invalid_argument for a non-positive FixedDuration length.
  void start_recording(RecordMode mode, double durationSeconds = 10.0);

  // No-op unless recording. A note-on at velocity 0 is stored as a note-off.
  void add_note(int note, int velocity, double timestampMs, bool isNoteOn);

  // Idempotent: returns the captured events (empty when idle or canceled).
  std::vector<midi::NoteEvent> stop_recording();

  // Discards everything captured so far. Returns false when idle.
  bool cancel_recording();

  // The events, but only when the session finished normally.
  std::optional<std::vector<midi::NoteEvent>> captured() const;

  RecorderState state() const { return state_; }
  bool is_recording() const { return state_ == RecorderState::Recording; }
  const RecordingSession &session() const { return session_; }

private:
  void reset_silence_timer();
  void clear_timers();
  void auto_stop(std::uint64_t generation);

  core::EventLoop &loop_;
  RecorderConfig config_;
  StoppedCallback onAutoStop_;

  RecorderState state_ = RecorderState::Idle;
  RecordingSession session_;
  std::uint64_t generation_ = 0;
  core::TimerId durationTimer_ = core::kNoTimer;
  core::TimerId silenceTimer_ = core::kNoTimer;
};

} // namespace capture
