// src/midi/tempo.hpp
// The single fixed tempo domain shared by the metronome, the SMF tick
// conversion and forced-duration playback.
//
// Contract:
//  - One TempoConfig is created by the application and handed by reference to
//    every component that needs timing. Nothing else hardcodes a BPM.
//  - ticks_per_second() is derived (ppqn * bpm / 60), so 96 ppqn at 100 BPM
//    gives the 160 ticks/s the file format is built around.

#pragma once
#include <cstdint>

namespace midi {

struct TempoConfig {
  double bpm = 100.0;
  unsigned ppqn = 96;              // ticks per quarter note written to files
  unsigned beatsPerCapture = 16;   // length of one take, in beats
  unsigned countInBeats = 4;

  [[nodiscard]] double seconds_per_beat() const { return 60.0 / bpm; }
  [[nodiscard]] double ticks_per_second() const { return ppqn * bpm / 60.0; }

  // The forced playback / padding length: beatsPerCapture beats (9.6 s at
  // 100 BPM).
  [[nodiscard]] double target_duration() const {
    return beatsPerCapture * seconds_per_beat();
  }
};

// Throws std::invalid_argument when bpm or ppqn cannot describe a tempo.
void validate(const TempoConfig &tempo);

// Seconds -> ticks at the file's ppqn; rounds to nearest, never negative.
std::uint32_t seconds_to_ticks(double seconds, const TempoConfig &tempo);

// Absolute tick -> seconds. `ppqn` is the division read from the file so a
// file written at another resolution still lands on the right time.
double ticks_to_seconds(std::uint32_t tick, unsigned ppqn,
                        const TempoConfig &tempo);

} // namespace midi
