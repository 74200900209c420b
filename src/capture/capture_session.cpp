// src/capture/capture_session.cpp

#include "capture/capture_session.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace capture {

const char *to_string(SessionState state) {
  switch (state) {
  case SessionState::Idle:
    return "idle";
  case SessionState::CountingIn:
    return "counting-in";
  case SessionState::Recording:
    return "recording";
  case SessionState::Stopped:
    return "stopped";
  case SessionState::Canceled:
    return "canceled";
  }
  return "unknown";
}

CaptureSession::CaptureSession(core::EventLoop &loop, BeatClock &clock,
                               NoteEventRecorder &recorder,
                               const midi::TempoConfig &tempo)
    : loop_(loop), clock_(clock), recorder_(recorder), tempo_(tempo) {
  clock_.on_count_in_complete([this] {
    if (state_ == SessionState::CountingIn) {
      transition(SessionState::Recording);
    }
  });
  recorder_.on_auto_stop([this](const std::vector<midi::NoteEvent> &) {
    if (state_ == SessionState::Recording) {
      transition(SessionState::Stopped);
    }
  });
}

void CaptureSession::begin(RecordMode mode, double durationSeconds,
                           bool countIn) {
  if (state_ == SessionState::CountingIn || state_ == SessionState::Recording) {
    spdlog::debug("begin ignored: take already {}", to_string(state_));
    return;
  }
  if (mode == RecordMode::FixedDuration && !(durationSeconds > 0.0)) {
    throw std::invalid_argument("Recording duration must be positive");
  }
  mode_ = mode;
  durationSeconds_ = durationSeconds;
  if (countIn) {
    transition(SessionState::CountingIn);
  } else {
    clock_.start(false);
    transition(SessionState::Recording);
  }
}

void CaptureSession::note_on(int note, int velocity) {
  recorder_.add_note(note, velocity, loop_.now_ms(), true);
}

void CaptureSession::note_off(int note, int velocity) {
  recorder_.add_note(note, velocity, loop_.now_ms(), false);
}

std::vector<midi::NoteEvent> CaptureSession::finish() {
  if (state_ == SessionState::CountingIn) {
    // Nothing was captured yet; an early finish is a cancel.
    transition(SessionState::Canceled);
    return {};
  }
  if (state_ != SessionState::Recording)
    return {};
  transition(SessionState::Stopped);
  return recorder_.stop_recording();
}

void CaptureSession::cancel() {
  if (state_ == SessionState::CountingIn || state_ == SessionState::Recording) {
    transition(SessionState::Canceled);
  }
}

std::optional<std::vector<std::uint8_t>>
CaptureSession::export_file(midi::EncodeMode mode) const {
  if (state_ != SessionState::Stopped)
    return std::nullopt;
  const auto events = recorder_.captured();
  if (!events)
    return std::nullopt;
  return midi::encode_smf(*events, tempo_, mode);
}

void CaptureSession::transition(SessionState next) {
  const SessionState prev = state_;
  switch (next) {
  case SessionState::CountingIn:
    clock_.start(true); // may throw; state is untouched then
    break;
  case SessionState::Recording:
    recorder_.start_recording(mode_, durationSeconds_);
    break;
  case SessionState::Stopped:
    clock_.stop();
    recorder_.stop_recording();
    break;
  case SessionState::Canceled:
    clock_.stop();
    recorder_.cancel_recording();
    break;
  case SessionState::Idle:
    break;
  }
  state_ = next;
  spdlog::debug("session {} -> {}", to_string(prev), to_string(next));
  if (onStateChange_) {
    onStateChange_(next);
  }
}

} // namespace capture
