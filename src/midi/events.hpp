// src/midi/events.hpp
// Core MIDI domain types shared across the app.
// Keep this header light: plain structs, no implementation details.

#pragma once
#include <cstdint>
#include <vector>

namespace midi {

// A captured or decoded note event. `time` is seconds relative to the start of
// the recording session (or of the file, after decoding).
struct NoteEvent {
  std::uint8_t note = 0;     // MIDI note number 0..127
  std::uint8_t velocity = 0; // 0..127
  double time = 0.0;         // seconds, >= 0
  bool isNoteOn = false;
};

// A note-on paired with its note-off: what a player actually triggers.
struct Note {
  std::uint8_t note = 0;
  std::uint8_t velocity = 0;
  double start = 0.0;    // seconds
  double duration = 0.0; // seconds the note sustains
};

// Parsed SMF header (subset we need)
struct SMFHeader {
  std::uint16_t format = 0;   // 0, 1, or 2
  std::uint16_t nTracks = 0;  // number of track chunks
  std::uint16_t division = 0; // raw division field
  unsigned ppqn = 96;         // ticks per quarter note
};

// Result of decoding a file: header + note events in file order.
struct Song {
  SMFHeader header;
  std::vector<NoteEvent> events;
  double length = 0.0; // seconds at the last end-of-track
};

} // namespace midi
