// src/audio/miniaudio_engine.hpp
// AudioEngine backed by a miniaudio playback device.
// Clicks are synthesized in the callback (short enveloped sine bursts); notes
// go through TinySoundFont when a SoundFont is supplied. Without one, note
// scheduling still keeps time but renders silence.
//
// The single-header library implementations live in the .cpp, so this header
// stays clean.

#pragma once
#include <filesystem>
#include <memory>
#include <optional>

#include "audio/engine.hpp"

namespace audio {

class MiniaudioEngine : public AudioEngine {
public:
  explicit MiniaudioEngine(std::optional<std::filesystem::path> soundFont = {},
                           unsigned sampleRate = 44100);
  ~MiniaudioEngine() override;

  MiniaudioEngine(const MiniaudioEngine &) = delete;
  MiniaudioEngine &operator=(const MiniaudioEngine &) = delete;

  void start() override;
  bool running() const override;
  double current_time() const override;
  void schedule_click(double when, bool accent) override;
  VoiceHandle schedule_note(double when, std::uint8_t note,
                            std::uint8_t velocity, double sustain) override;
  void cancel(VoiceHandle voice) override;
  void suspend() override;
  void resume() override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace audio
