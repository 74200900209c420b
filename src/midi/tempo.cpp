// src/midi/tempo.cpp
// Implementation of timing utilities.

#include "midi/tempo.hpp"

#include <cmath>
#include <stdexcept>

namespace midi {

namespace {

// Largest value a 4-byte VLQ can carry.
constexpr double kMaxTicks = 0x0FFFFFFF;

} // namespace

void validate(const TempoConfig &tempo) {
  if (!(tempo.bpm > 0.0) || !std::isfinite(tempo.bpm)) {
    throw std::invalid_argument("Tempo must be a positive BPM");
  }
  if (tempo.ppqn == 0 || tempo.ppqn > 0x7FFF) {
    throw std::invalid_argument("Ticks per quarter note must be 1..32767");
  }
  if (tempo.beatsPerCapture == 0) {
    throw std::invalid_argument("A capture must span at least one beat");
  }
}

std::uint32_t seconds_to_ticks(double seconds, const TempoConfig &tempo) {
  const double ticks = std::round(seconds * tempo.ticks_per_second());
  if (!(ticks > 0.0))
    return 0; // negative gaps (out-of-order input) clamp to zero
  if (ticks > kMaxTicks)
    return static_cast<std::uint32_t>(kMaxTicks);
  return static_cast<std::uint32_t>(ticks);
}

double ticks_to_seconds(std::uint32_t tick, unsigned ppqn,
                        const TempoConfig &tempo) {
  const double quarterNotes = tick / static_cast<double>(ppqn);
  return quarterNotes * tempo.seconds_per_beat();
}

} // namespace midi
