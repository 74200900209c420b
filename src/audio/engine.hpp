// src/audio/engine.hpp
// The hardware audio clock + sample-accurate event scheduler.
//
// One engine instance is owned by the application and passed by reference to
// the metronome and the playback scheduler, so clicks and notes share one
// clock. The engine initializes lazily on the first start().
//
// Times are engine seconds (current_time()): monotonic, advancing only while
// the engine runs. Everything scheduled here fires with audio precision; the
// cooperative side merely decides what to enqueue ahead of time.

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace audio {

// The audio device could not be opened, started or resumed.
struct AudioEngineError : std::runtime_error {
  explicit AudioEngineError(const std::string &what)
      : std::runtime_error(what) {}
};

using VoiceHandle = std::uint64_t;
constexpr VoiceHandle kNoVoice = 0;

class AudioEngine {
public:
  virtual ~AudioEngine() = default;

  // Initialize on first use, resume if suspended. Throws AudioEngineError.
  virtual void start() = 0;
  virtual bool running() const = 0;

  virtual double current_time() const = 0;

  // Metronome click at `when`. Accented clicks mark the count-in.
  virtual void schedule_click(double when, bool accent) = 0;

  // Note sounding from `when` for `sustain` seconds.
  virtual VoiceHandle schedule_note(double when, std::uint8_t note,
                                    std::uint8_t velocity, double sustain) = 0;

  // Drop a pending note or release it if it is already sounding.
  virtual void cancel(VoiceHandle voice) = 0;

  // Freeze / unfreeze the clock. Pending events keep their times.
  virtual void suspend() = 0;
  virtual void resume() = 0;
};

} // namespace audio
