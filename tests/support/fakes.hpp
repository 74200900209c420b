// tests/support/fakes.hpp
// Deterministic stand-ins for the clock and the audio device.

#pragma once
#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "audio/engine.hpp"
#include "capture/beat_indicator.hpp"
#include "core/event_loop.hpp"
#include "core/time_source.hpp"

namespace testing {

struct ManualTime : core::TimeSource {
  double ms = 0.0;
  double now_ms() const override { return ms; }
};

// Move the manual clock forward by `deltaMs`, stopping at every timer deadline
// on the way so callbacks see the time they were due at.
inline void advance(ManualTime &time, core::EventLoop &loop, double deltaMs) {
  const double target = time.ms + deltaMs;
  while (auto next = loop.next_deadline()) {
    if (*next > target)
      break;
    time.ms = std::max(time.ms, *next);
    loop.run_due();
  }
  time.ms = target;
  loop.run_due();
}

// Jump the clock without visiting intermediate deadlines: late timers.
inline void jump(ManualTime &time, core::EventLoop &loop, double deltaMs) {
  time.ms += deltaMs;
  loop.run_due();
}

// Engine clock follows the manual time while running, frozen while suspended.
class FakeEngine : public audio::AudioEngine {
public:
  struct Click {
    double when;
    bool accent;
  };
  struct Voice {
    double when;
    std::uint8_t note;
    std::uint8_t velocity;
    double sustain;
  };

  explicit FakeEngine(const ManualTime &time) : time_(time) {}

  void start() override {
    ++startCalls;
    if (failStart) {
      throw audio::AudioEngineError("no audio device");
    }
    resume();
  }
  bool running() const override { return running_; }

  double current_time() const override {
    const double ms = elapsedMs_ + (running_ ? time_.ms - since_ : 0.0);
    return ms / 1000.0;
  }

  void schedule_click(double when, bool accent) override {
    clicks.push_back(Click{when, accent});
  }

  audio::VoiceHandle schedule_note(double when, std::uint8_t note,
                                   std::uint8_t velocity,
                                   double sustain) override {
    const audio::VoiceHandle h = next_++;
    voices.emplace(h, Voice{when, note, velocity, sustain});
    return h;
  }

  void cancel(audio::VoiceHandle voice) override { cancelled.insert(voice); }

  void suspend() override {
    if (!running_)
      return;
    elapsedMs_ += time_.ms - since_;
    running_ = false;
    ++suspendCalls;
  }

  void resume() override {
    if (running_)
      return;
    since_ = time_.ms;
    running_ = true;
  }

  std::vector<Click> accented() const {
    std::vector<Click> out;
    std::copy_if(clicks.begin(), clicks.end(), std::back_inserter(out),
                 [](const Click &c) { return c.accent; });
    return out;
  }

  bool failStart = false;
  int startCalls = 0;
  int suspendCalls = 0;
  std::vector<Click> clicks;
  std::map<audio::VoiceHandle, Voice> voices;
  std::set<audio::VoiceHandle> cancelled;

private:
  const ManualTime &time_;
  bool running_ = false;
  double elapsedMs_ = 0.0;
  double since_ = 0.0;
  audio::VoiceHandle next_ = 1;
};

struct RecordingIndicator : capture::BeatIndicator {
  struct Shown {
    unsigned beat;
    bool countIn;
  };
  void show_beat(unsigned beat, bool countIn) override {
    shown.push_back(Shown{beat, countIn});
  }
  void clear_flash() override { ++flashesCleared; }
  void reset() override { ++resets; }

  std::vector<Shown> shown;
  int flashesCleared = 0;
  int resets = 0;
};

} // namespace testing
