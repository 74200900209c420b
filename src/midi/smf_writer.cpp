// src/midi/smf_writer.cpp
// Serialize captured note events into a format 0 Standard MIDI File.
// Layout:
//   MThd 00000006 0000 0001 <ppqn>
//   MTrk <length> { <vlq delta> <status> <note> <velocity> }* 00 FF 2F 00

#include "common/writer.hpp"
#include "midi/smf.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

namespace {

constexpr std::uint8_t kNoteOn = 0x90;  // channel 0
constexpr std::uint8_t kNoteOff = 0x80; // channel 0

void write_note(ByteWriter &w, std::uint32_t delta, bool on, std::uint8_t note,
                std::uint8_t velocity) {
  std::uint8_t vel = static_cast<std::uint8_t>(velocity & 0x7F);
  if (on && vel == 0) {
    vel = 1; // 0x90 with velocity 0 would read back as a note-off
  }
  write_vlq(w, delta);
  w.bytes({on ? kNoteOn : kNoteOff, static_cast<std::uint8_t>(note & 0x7F),
           vel});
}

// Sorted copy of the capture, shifted so the earliest event is at 0 s.
std::vector<midi::NoteEvent> normalize(std::vector<midi::NoteEvent> events) {
  std::stable_sort(events.begin(), events.end(),
                   [](const midi::NoteEvent &a, const midi::NoteEvent &b) {
                     return a.time < b.time;
                   });
  const double first = events.front().time;
  for (auto &ev : events) {
    ev.time -= first;
  }
  return events;
}

std::vector<std::uint8_t> build_track(const std::vector<midi::NoteEvent> &notes,
                                      const midi::TempoConfig &tempo,
                                      midi::EncodeMode mode) {
  ByteWriter w;
  const bool padded = mode == midi::EncodeMode::PlaybackPadded;

  if (padded) {
    write_note(w, 0, true, midi::kPaddingNote, midi::kPaddingVelocity);
  }

  // Deltas come from rounded absolute positions, so rounding never
  // accumulates along the track.
  std::uint32_t previous = 0;
  for (const auto &ev : notes) {
    const std::uint32_t tick = midi::seconds_to_ticks(ev.time, tempo);
    write_note(w, tick > previous ? tick - previous : 0, ev.isNoteOn, ev.note,
               ev.velocity);
    previous = std::max(previous, tick);
  }

  if (padded) {
    // Release the sustain exactly at the target duration. A take longer than
    // the target simply releases it right after the last note.
    const std::uint32_t target =
        midi::seconds_to_ticks(tempo.target_duration(), tempo);
    write_note(w, target > previous ? target - previous : 0, false,
               midi::kPaddingNote, 0);
  }

  // End of track
  w.bytes({0x00, 0xFF, 0x2F, 0x00});
  return std::move(w.data);
}

} // namespace

namespace midi {

std::vector<std::uint8_t> encode_smf(const std::vector<NoteEvent> &events,
                                     const TempoConfig &tempo,
                                     EncodeMode mode) {
  if (events.empty()) {
    throw EmptyCaptureError();
  }
  validate(tempo);

  const std::vector<std::uint8_t> track =
      build_track(normalize(events), tempo, mode);

  ByteWriter w;
  // Header chunk
  w.bytes({'M', 'T', 'h', 'd'});
  w.be32(6);
  w.be16(0); // format 0
  w.be16(1); // one track
  w.be16(static_cast<std::uint16_t>(tempo.ppqn));

  // Track chunk
  w.bytes({'M', 'T', 'r', 'k'});
  w.be32(static_cast<std::uint32_t>(track.size()));
  w.bytes(track);
  return std::move(w.data);
}

} // namespace midi
