// src/midi/smf.cpp
// Parse a Standard MIDI File (SMF) from memory into midi::Song.
// Pure parsing: no printing, no I/O.

#include "midi/smf.hpp"
#include "common/reader.hpp" // Bytes cursor + read_vlq()
#include "midi/events.hpp"

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <utility>
#include <vector>

namespace {

constexpr std::uint32_t kHeaderId = 0x4D546864; // "MThd"
constexpr std::uint32_t kTrackId = 0x4D54726B;  // "MTrk"

// Parse SMF header (MThd chunk) and fill midi::SMFHeader.
midi::SMFHeader parse_header(Bytes &r) {
  const std::uint32_t id = r.be32();
  if (id != kHeaderId) {
    throw midi::MalformedFileError("Not a MIDI file (missing 'MThd')");
  }

  const std::uint32_t length = r.be32();
  if (length != 6) {
    throw midi::MalformedFileError("Header chunk length must be 6");
  }

  midi::SMFHeader h{};
  h.format = r.be16();
  h.nTracks = r.be16();
  h.division = r.be16();

  if ((h.division & 0x8000) != 0) {
    // SMPTE timing has no place in a fixed-tempo capture.
    throw midi::MalformedFileError("SMPTE time division is not supported");
  }
  h.ppqn = static_cast<unsigned>(h.division & 0x7FFF);
  if (h.ppqn == 0) {
    throw midi::MalformedFileError("Ticks per quarter note must be non-zero");
  }
  if (h.nTracks == 0) {
    throw midi::MalformedFileError("File declares no tracks");
  }

  return h; // r.off now points to first track chunk (MTrk)
}

// Walk a single MTrk chunk and append note events to `out`.
// Returns the absolute tick of the track's end.
std::uint32_t walk_one_track(Bytes &r, unsigned ppqn,
                             const midi::TempoConfig &tempo,
                             std::vector<midi::NoteEvent> &out) {
  const std::uint32_t id = r.be32();
  if (id != kTrackId) {
    throw midi::MalformedFileError("Missing 'MTrk' chunk");
  }
  const std::uint32_t len = r.be32();

  // Sub-cursor for exactly this track's bytes: nothing below can read past the
  // declared length.
  Bytes tr = r.take(len);

  std::uint32_t tick = 0;
  std::uint8_t running = 0; // last seen channel status for running status
  bool ended = false;

  while (!tr.at_end()) {
    // 1) Delta-time (Variable-Length Quantity)
    tick += read_vlq(tr);

    // 2) Status or running status?
    std::uint8_t first = tr.u8();
    std::uint8_t status = 0;
    bool haveData1 = false;
    std::uint8_t data1 = 0;

    if (first & 0x80) {
      status = first;
      if ((status & 0xF0) < 0xF0) {
        running = status; // only channel messages set running status
      }
    } else {
      if (running == 0) {
        throw midi::MalformedFileError("Running status used before any status");
      }
      status = running;
      haveData1 = true;
      data1 = first;
    }

    const std::uint8_t type = status & 0xF0;

    // Channel messages with two data bytes
    if (type == 0x80 || type == 0x90 || type == 0xA0 || type == 0xB0 ||
        type == 0xE0) {
      std::uint8_t d1 = haveData1 ? data1 : tr.u8();
      std::uint8_t d2 = tr.u8();

      if (type == 0x80 || type == 0x90) {
        midi::NoteEvent ev;
        ev.note = static_cast<std::uint8_t>(d1 & 0x7F);
        ev.velocity = static_cast<std::uint8_t>(d2 & 0x7F);
        ev.time = midi::ticks_to_seconds(tick, ppqn, tempo);
        // Note On with velocity 0 is a Note Off
        ev.isNoteOn = type == 0x90 && ev.velocity != 0;
        out.push_back(ev);
      }
      // Poly AT, CC, Pitch Bend are skipped
      continue;
    }

    // Program Change / Channel Pressure: one data byte, skipped
    if (type == 0xC0 || type == 0xD0) {
      if (!haveData1)
        tr.skip(1);
      continue;
    }

    // Meta events
    if (status == 0xFF) {
      std::uint8_t metaType = tr.u8();
      std::uint32_t mlen = read_vlq(tr);
      tr.skip(mlen);
      if (metaType == 0x2F) { // End of Track
        ended = true;
        break;
      }
      continue; // tempo, names, markers... the tempo domain is fixed
    }

    // SysEx events
    if (status == 0xF0 || status == 0xF7) {
      tr.skip(read_vlq(tr));
      continue;
    }

    std::ostringstream oss;
    oss << "Unsupported or malformed status byte: 0x" << std::hex
        << int(status);
    throw midi::MalformedFileError(oss.str());
  }

  if (!ended) {
    throw midi::MalformedFileError("Track ended without End of Track event");
  }
  return tick;
}

// The padded playback encoding opens with a near-silent note-on at 0 and
// closes it as the very last event. Callers only ever see the real notes.
void strip_padding(std::vector<midi::NoteEvent> &events) {
  if (events.size() < 2)
    return;
  const midi::NoteEvent &head = events.front();
  const midi::NoteEvent &tail = events.back();
  const bool paddedHead = head.isNoteOn && head.note == midi::kPaddingNote &&
                          head.velocity == midi::kPaddingVelocity &&
                          head.time == 0.0;
  const bool paddedTail = !tail.isNoteOn && tail.note == midi::kPaddingNote;
  if (paddedHead && paddedTail) {
    events.pop_back();
    events.erase(events.begin());
  }
}

} // namespace

namespace midi {

Song decode_smf(const std::vector<std::uint8_t> &bytes,
                const TempoConfig &tempo, bool stripPadding) {
  Bytes r(bytes);

  SMFHeader header = parse_header(r);

  std::vector<NoteEvent> events;
  std::uint32_t endTick = 0;
  for (std::uint16_t i = 0; i < header.nTracks; ++i) {
    endTick = std::max(endTick, walk_one_track(r, header.ppqn, tempo, events));
  }

  // Tracks are laid out one after another; interleave them on the timeline.
  std::stable_sort(events.begin(), events.end(),
                   [](const NoteEvent &a, const NoteEvent &b) {
                     return a.time < b.time;
                   });
  if (stripPadding) {
    strip_padding(events);
  }

  Song song;
  song.header = header;
  song.events = std::move(events);
  song.length = ticks_to_seconds(endTick, header.ppqn, tempo);
  return song;
}

} // namespace midi
