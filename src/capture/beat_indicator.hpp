// src/capture/beat_indicator.hpp
// Sink for the visible side of the metronome. Optional everywhere: components
// hold a nullable pointer and simply skip updates when none is attached.

#pragma once

namespace capture {

class BeatIndicator {
public:
  virtual ~BeatIndicator() = default;
  // `beat` is 1..4 during the count-in, then 1, 2, ... while recording.
  virtual void show_beat(unsigned beat, bool countIn) = 0;
  // Drop the short highlight of the last beat; the beat number stays up.
  virtual void clear_flash() {}
  // Clear any highlighted state.
  virtual void reset() = 0;
};

} // namespace capture
