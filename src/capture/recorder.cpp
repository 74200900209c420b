// src/capture/recorder.cpp

#include "capture/recorder.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace capture {

namespace {

const char *mode_name(RecordMode mode) {
  return mode == RecordMode::FixedDuration ? "fixed-duration" : "silence";
}

} // namespace

NoteEventRecorder::NoteEventRecorder(core::EventLoop &loop,
                                     RecorderConfig config)
    : loop_(loop), config_(config) {}

NoteEventRecorder::~NoteEventRecorder() { clear_timers(); }

void NoteEventRecorder::start_recording(RecordMode mode,
                                        double durationSeconds) {
  if (mode == RecordMode::FixedDuration && !(durationSeconds > 0.0)) {
    throw std::invalid_argument("Recording duration must be positive");
  }

  // Whatever came before is gone: timers, events, the canceled flag.
  clear_timers();
  ++generation_;
  session_ = RecordingSession{};
  session_.mode = mode;
  session_.startTimestamp = loop_.now_ms();
  session_.durationBound =
      mode == RecordMode::FixedDuration ? durationSeconds : 0.0;
  state_ = RecorderState::Recording;

  spdlog::info("recording started ({} mode)", mode_name(mode));

  const std::uint64_t generation = generation_;
  if (mode == RecordMode::FixedDuration) {
    durationTimer_ = loop_.set_timeout(
        durationSeconds * 1000.0, [this, generation] { auto_stop(generation); });
  } else {
    reset_silence_timer();
  }
}

void NoteEventRecorder::add_note(int note, int velocity, double timestampMs,
                                 bool isNoteOn) {
  if (state_ != RecorderState::Recording)
    return;
  if (note < 0 || note > 127 || velocity < 0 || velocity > 127) {
    spdlog::warn("ignoring out-of-range note {} velocity {}", note, velocity);
    return;
  }

  // Note On with velocity 0 is a Note Off
  if (isNoteOn && velocity == 0) {
    isNoteOn = false;
  }

  midi::NoteEvent ev;
  ev.note = static_cast<std::uint8_t>(note);
  ev.velocity = static_cast<std::uint8_t>(velocity);
  ev.time = std::max(0.0, (timestampMs - session_.startTimestamp) / 1000.0);
  ev.isNoteOn = isNoteOn;
  session_.events.push_back(ev);

  if (session_.mode == RecordMode::SilenceTimeout && isNoteOn) {
    reset_silence_timer();
  }
}

std::vector<midi::NoteEvent> NoteEventRecorder::stop_recording() {
  if (state_ == RecorderState::Recording) {
    state_ = RecorderState::Stopped;
    ++generation_;
    clear_timers();
    spdlog::info("recording stopped: {:.1f}s, {} events",
                 (loop_.now_ms() - session_.startTimestamp) / 1000.0,
                 session_.events.size());
  }
  if (state_ == RecorderState::Stopped)
    return session_.events;
  return {};
}

bool NoteEventRecorder::cancel_recording() {
  if (state_ != RecorderState::Recording) {
    spdlog::debug("no recording to cancel");
    return false;
  }

  const std::size_t discarded = session_.events.size();
  ++generation_;
  clear_timers();
  session_.canceled = true;
  session_.events.clear();
  session_.events.shrink_to_fit();
  state_ = RecorderState::Canceled;

  spdlog::info("recording canceled, {} events discarded", discarded);
  return true;
}

std::optional<std::vector<midi::NoteEvent>>
NoteEventRecorder::captured() const {
  if (state_ != RecorderState::Stopped)
    return std::nullopt;
  return session_.events;
}

void NoteEventRecorder::reset_silence_timer() {
  loop_.clear_timeout(silenceTimer_);
  const std::uint64_t generation = generation_;
  silenceTimer_ = loop_.set_timeout(
      config_.silenceTimeoutMs, [this, generation] { auto_stop(generation); });
}

void NoteEventRecorder::clear_timers() {
  loop_.clear_timeout(durationTimer_);
  loop_.clear_timeout(silenceTimer_);
  durationTimer_ = core::kNoTimer;
  silenceTimer_ = core::kNoTimer;
}

void NoteEventRecorder::auto_stop(std::uint64_t generation) {
  if (generation != generation_ || state_ != RecorderState::Recording)
    return;
  spdlog::debug("{} timer ended the recording",
                session_.mode == RecordMode::FixedDuration ? "duration"
                                                            : "silence");
  const std::vector<midi::NoteEvent> events = stop_recording();
  if (onAutoStop_) {
    onAutoStop_(events);
  }
}

} // namespace capture
