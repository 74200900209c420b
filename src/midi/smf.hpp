// src/midi/smf.hpp
// Public API: Standard MIDI File (SMF) reading and writing.
// - No printing here; pure data transformation.
// - Decoding throws midi::MalformedFileError, encoding midi::EmptyCaptureError.
// - Timing always goes through the shared TempoConfig.

#pragma once
#include <cstdint>
#include <vector>

#include "midi/errors.hpp"
#include "midi/events.hpp"
#include "midi/tempo.hpp"

namespace midi {

enum class EncodeMode {
  Export,        // exactly the captured notes
  PlaybackPadded // adds a silent sustain note so the file spans the target
};

// Padding note written by EncodeMode::PlaybackPadded. Decoding strips it only
// when asked to.
constexpr std::uint8_t kPaddingNote = 127;
constexpr std::uint8_t kPaddingVelocity = 1;

// Serialize a capture into a format 0, single track SMF.
// Events are stably sorted by time and shifted so the earliest one sits at 0.
// A note-on is never written with velocity 0 (that byte pattern means
// note-off); it goes out at velocity 1.
// Throws EmptyCaptureError when `events` is empty.
std::vector<std::uint8_t> encode_smf(const std::vector<NoteEvent> &events,
                                     const TempoConfig &tempo,
                                     EncodeMode mode = EncodeMode::Export);

// Parse an entire SMF already loaded in memory.
// On success, returns a Song containing:
//   - header : SMFHeader (format, nTracks, ppqn)
//   - events : note on/off events across tracks, seconds from file start
//   - length : seconds at the latest end-of-track
// Meta, sysex and non-note channel events are skipped.
// With `stripPadding`, a leading padding note-on at 0 and its trailing
// note-off are removed; playback sets it, plain reads keep every event.
// On failure, throws MalformedFileError; there is no partial result.
Song decode_smf(const std::vector<std::uint8_t> &bytes,
                const TempoConfig &tempo, bool stripPadding = false);

// Pair note-ons with note-offs (first-in first-out per pitch). A note-on left
// open sustains until the last event in the list.
std::vector<Note> pair_notes(const std::vector<NoteEvent> &events);

} // namespace midi
