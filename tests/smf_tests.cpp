// tests/smf_tests.cpp
// SMF encoding and decoding under the fixed tempo domain.

#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <vector>

#include "common/writer.hpp"
#include "midi/smf.hpp"
#include "midi/tempo.hpp"

using midi::NoteEvent;
using Blob = std::vector<std::uint8_t>;

namespace {

NoteEvent on(int note, int vel, double t) {
  return NoteEvent{static_cast<std::uint8_t>(note),
                   static_cast<std::uint8_t>(vel), t, true};
}

NoteEvent off(int note, double t, int vel = 0) {
  return NoteEvent{static_cast<std::uint8_t>(note),
                   static_cast<std::uint8_t>(vel), t, false};
}

// Everything after the 14-byte header chunk and the 8-byte track header.
Blob track_body(const Blob &file) { return Blob(file.begin() + 22, file.end()); }

Blob vlq(std::uint32_t v) {
  ByteWriter w;
  write_vlq(w, v);
  return w.data;
}

Blob with_track(const Blob &track, std::uint16_t division = 0x0060) {
  ByteWriter w;
  w.bytes({'M', 'T', 'h', 'd', 0, 0, 0, 6, 0, 0, 0, 1});
  w.be16(division);
  w.bytes({'M', 'T', 'r', 'k'});
  w.be32(static_cast<std::uint32_t>(track.size()));
  w.bytes(track);
  return w.data;
}

} // namespace

TEST_CASE("TempoConfig: derives tick rate and target length from bpm",
          "[midi][tempo]") {
  midi::TempoConfig tempo;
  CHECK(tempo.ticks_per_second() == Approx(160.0));
  CHECK(tempo.target_duration() == Approx(9.6));
  CHECK(midi::seconds_to_ticks(0.5, tempo) == 80u);
  CHECK(midi::seconds_to_ticks(-0.25, tempo) == 0u);
  CHECK(midi::ticks_to_seconds(96, 96, tempo) == Approx(0.6));

  tempo.bpm = 120.0;
  CHECK(tempo.ticks_per_second() == Approx(192.0));
  CHECK(tempo.target_duration() == Approx(8.0));

  tempo.bpm = 0.0;
  CHECK_THROWS_AS(midi::validate(tempo), std::invalid_argument);
}

TEST_CASE("write_vlq: big-endian 7-bit groups", "[midi][vlq]") {
  CHECK(vlq(0) == Blob{0x00});
  CHECK(vlq(0x7F) == Blob{0x7F});
  CHECK(vlq(0x80) == Blob{0x81, 0x00});
  CHECK(vlq(160) == Blob{0x81, 0x20});
  CHECK(vlq(32000) == Blob{0x81, 0xFA, 0x00});
  CHECK(vlq(0x0FFFFFFF) == Blob{0xFF, 0xFF, 0xFF, 0x7F});
}

TEST_CASE("encode_smf: byte-exact file for a single note", "[midi][encode]") {
  midi::TempoConfig tempo;
  const Blob file = midi::encode_smf({on(60, 100, 0.2), off(60, 0.7)}, tempo);

  const Blob expected{
      0x4D, 0x54, 0x68, 0x64, 0x00, 0x00, 0x00, 0x06, 0x00, 0x00, 0x00,
      0x01, 0x00, 0x60, 0x4D, 0x54, 0x72, 0x6B, 0x00, 0x00, 0x00, 0x0C,
      0x00, 0x90, 0x3C, 0x64, 0x50, 0x80, 0x3C, 0x00, 0x00, 0xFF, 0x2F,
      0x00};
  CHECK(file == expected);
}

TEST_CASE("encode_smf: long gaps use multi-byte deltas", "[midi][encode]") {
  midi::TempoConfig tempo;

  SECTION("one second is 160 ticks") {
    const Blob body =
        track_body(midi::encode_smf({on(60, 90, 0.0), off(60, 1.0)}, tempo));
    CHECK(body == Blob{0x00, 0x90, 0x3C, 0x5A, 0x81, 0x20, 0x80, 0x3C, 0x00,
                       0x00, 0xFF, 0x2F, 0x00});
  }

  SECTION("two hundred seconds is three bytes") {
    const Blob body =
        track_body(midi::encode_smf({on(60, 90, 0.0), off(60, 200.0)}, tempo));
    CHECK(Blob(body.begin() + 4, body.begin() + 7) == Blob{0x81, 0xFA, 0x00});
  }
}

TEST_CASE("encode_smf: sorts by time and removes leading silence",
          "[midi][encode]") {
  midi::TempoConfig tempo;
  // Arrival order is not time order.
  const Blob body = track_body(midi::encode_smf(
      {on(64, 80, 1.5), on(60, 70, 1.0), off(60, 2.0), off(64, 2.0)}, tempo));

  const Blob expected{0x00, 0x90, 0x3C, 0x46, // 60 on at 0
                      0x50, 0x90, 0x40, 0x50, // 64 on at 0.5 s
                      0x50, 0x80, 0x3C, 0x00, // 60 off at 1.0 s
                      0x00, 0x80, 0x40, 0x00, // 64 off, tie keeps order
                      0x00, 0xFF, 0x2F, 0x00};
  CHECK(body == expected);
}

TEST_CASE("encode_smf: empty capture is refused", "[midi][encode]") {
  midi::TempoConfig tempo;
  CHECK_THROWS_AS(midi::encode_smf({}, tempo), midi::EmptyCaptureError);
  CHECK_THROWS_AS(
      midi::encode_smf({}, tempo, midi::EncodeMode::PlaybackPadded),
      midi::EmptyCaptureError);
}

TEST_CASE("encode_smf: padded mode spans the target duration",
          "[midi][encode][padded]") {
  midi::TempoConfig tempo;

  SECTION("short take is padded to 9.6 s") {
    const Blob file = midi::encode_smf({on(60, 100, 0.0), off(60, 1.0)}, tempo,
                                       midi::EncodeMode::PlaybackPadded);
    const Blob expected{0x00, 0x90, 0x7F, 0x01,       // padding on
                        0x00, 0x90, 0x3C, 0x64,       // 60 on
                        0x81, 0x20, 0x80, 0x3C, 0x00, // 60 off at 1.0 s
                        0x8A, 0x60, 0x80, 0x7F, 0x00, // padding off at 9.6 s
                        0x00, 0xFF, 0x2F, 0x00};
    CHECK(track_body(file) == expected);

    const midi::Song song = midi::decode_smf(file, tempo, true);
    CHECK(song.length == Approx(9.6));
    REQUIRE(song.events.size() == 2);
    CHECK(song.events[0].note == 60);
    CHECK(song.events[1].note == 60);

    // Read without stripping, the padding pair is ordinary data.
    const midi::Song raw = midi::decode_smf(file, tempo);
    REQUIRE(raw.events.size() == 4);
    CHECK(raw.events.front().note == midi::kPaddingNote);
    CHECK(raw.events.back().note == midi::kPaddingNote);
  }

  SECTION("take longer than the target releases right after the last note") {
    const Blob file = midi::encode_smf({on(60, 100, 0.0), off(60, 12.0)},
                                       tempo, midi::EncodeMode::PlaybackPadded);
    const midi::Song song = midi::decode_smf(file, tempo, true);
    CHECK(song.length == Approx(12.0));
    CHECK(song.events.size() == 2);
  }
}

TEST_CASE("decode_smf: exported note 127 at velocity 1 is kept",
          "[midi][decode][padded]") {
  midi::TempoConfig tempo;
  const Blob file = midi::encode_smf(
      {on(127, 1, 0.0), on(60, 90, 0.2), off(60, 0.4), off(127, 1.0)}, tempo);

  const midi::Song song = midi::decode_smf(file, tempo);
  REQUIRE(song.events.size() == 4);
  CHECK(song.events[0].note == 127);
  CHECK(song.events[0].velocity == 1);
  CHECK(song.events[0].isNoteOn);
  CHECK(song.events[3].note == 127);
  CHECK_FALSE(song.events[3].isNoteOn);
  CHECK(song.length == Approx(1.0));
}

TEST_CASE("encode_smf: a silent note-on still reads back as a note-on",
          "[midi][encode]") {
  midi::TempoConfig tempo;
  const Blob file = midi::encode_smf({on(60, 0, 0.0), off(60, 0.5)}, tempo);
  const Blob expected{0x00, 0x90, 0x3C, 0x01, // velocity raised to 1
                      0x50, 0x80, 0x3C, 0x00,
                      0x00, 0xFF, 0x2F, 0x00};
  CHECK(track_body(file) == expected);

  const midi::Song song = midi::decode_smf(file, tempo);
  REQUIRE(song.events.size() == 2);
  CHECK(song.events[0].isNoteOn);
  CHECK_FALSE(song.events[1].isNoteOn);

  const auto notes = midi::pair_notes(song.events);
  REQUIRE(notes.size() == 1);
  CHECK(notes[0].duration == Approx(0.5));
}

TEST_CASE("decode_smf: round trip keeps order, notes and timing",
          "[midi][decode]") {
  midi::TempoConfig tempo;
  std::mt19937 rng(1234);
  std::uniform_real_distribution<double> when(0.3, 9.0);
  std::uniform_int_distribution<int> pitch(21, 108);
  std::uniform_int_distribution<int> vel(1, 127);

  std::vector<NoteEvent> events;
  for (int i = 0; i < 24; ++i) {
    const double t = when(rng);
    const int n = pitch(rng);
    events.push_back(on(n, vel(rng), t));
    events.push_back(off(n, t + 0.25, vel(rng)));
  }

  const midi::Song song = midi::decode_smf(midi::encode_smf(events, tempo), tempo);
  REQUIRE(song.events.size() == events.size());

  std::vector<NoteEvent> sorted = events;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const NoteEvent &a, const NoteEvent &b) {
                     return a.time < b.time;
                   });
  const double first = sorted.front().time;
  const double tick = 1.0 / tempo.ticks_per_second();
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    INFO("event " << i);
    CHECK(song.events[i].note == sorted[i].note);
    CHECK(song.events[i].velocity == sorted[i].velocity);
    CHECK(song.events[i].isNoteOn == sorted[i].isNoteOn);
    CHECK(std::abs(song.events[i].time - (sorted[i].time - first)) <= tick);
  }
}

TEST_CASE("decode_smf: skips meta and controller events, honours running status",
          "[midi][decode]") {
  midi::TempoConfig tempo;
  const Blob track{
      0x00, 0xFF, 0x51, 0x03, 0x07, 0xA1, 0x20,       // tempo meta
      0x00, 0xFF, 0x03, 0x04, 'P',  'n',  'o',  '1', // track name
      0x00, 0xB0, 0x07, 0x64,                         // CC 7
      0x00, 0x90, 0x3C, 0x64,                         // 60 on
      0x60, 0x3E, 0x50,                               // running: 62 on
      0x30, 0x3C, 0x00,                               // running: 60 vel 0
      0x00, 0x80, 0x3E, 0x40,                         // 62 off
      0x00, 0xFF, 0x2F, 0x00};

  const midi::Song song = midi::decode_smf(with_track(track), tempo);
  CHECK(song.header.format == 0);
  CHECK(song.header.nTracks == 1);
  CHECK(song.header.ppqn == 96);
  REQUIRE(song.events.size() == 4);

  CHECK(song.events[0].isNoteOn);
  CHECK(song.events[0].time == Approx(0.0));
  CHECK(song.events[1].note == 62);
  CHECK(song.events[1].velocity == 80);
  CHECK(song.events[1].time == Approx(0.6));
  CHECK_FALSE(song.events[2].isNoteOn);
  CHECK(song.events[2].note == 60);
  CHECK(song.events[2].time == Approx(0.9));
  CHECK_FALSE(song.events[3].isNoteOn);
  CHECK(song.events[3].velocity == 64);
  CHECK(song.length == Approx(0.9));
}

TEST_CASE("decode_smf: malformed input is rejected whole", "[midi][decode]") {
  midi::TempoConfig tempo;
  const Blob goodTrack{0x00, 0x90, 0x3C, 0x64, 0x00, 0xFF, 0x2F, 0x00};

  SECTION("empty buffer") {
    CHECK_THROWS_AS(midi::decode_smf({}, tempo), midi::MalformedFileError);
  }

  SECTION("wrong header magic") {
    Blob file = with_track(goodTrack);
    file[0] = 'R';
    CHECK_THROWS_AS(midi::decode_smf(file, tempo), midi::MalformedFileError);
  }

  SECTION("wrong header length") {
    Blob file = with_track(goodTrack);
    file[7] = 7;
    CHECK_THROWS_AS(midi::decode_smf(file, tempo), midi::MalformedFileError);
  }

  SECTION("wrong track magic") {
    Blob file = with_track(goodTrack);
    file[14] = 'X';
    CHECK_THROWS_AS(midi::decode_smf(file, tempo), midi::MalformedFileError);
  }

  SECTION("track length past the end of the buffer") {
    Blob file = with_track(goodTrack);
    file[21] = 0x40;
    CHECK_THROWS_AS(midi::decode_smf(file, tempo), midi::MalformedFileError);
  }

  SECTION("event cut by the declared track length") {
    // Declared length 3 stops mid-event even though more bytes follow.
    Blob file = with_track({0x00, 0x90, 0x3C});
    file.insert(file.end(), {0x64, 0x00, 0xFF, 0x2F, 0x00});
    CHECK_THROWS_AS(midi::decode_smf(file, tempo), midi::MalformedFileError);
  }

  SECTION("missing end of track") {
    CHECK_THROWS_AS(midi::decode_smf(with_track({0x00, 0x90, 0x3C, 0x64}), tempo),
                    midi::MalformedFileError);
  }

  SECTION("SMPTE division") {
    CHECK_THROWS_AS(midi::decode_smf(with_track(goodTrack, 0xE250), tempo),
                    midi::MalformedFileError);
  }
}

TEST_CASE("pair_notes: matches offs to ons per pitch", "[midi][notes]") {
  const std::vector<NoteEvent> events{on(60, 100, 0.0), on(60, 90, 0.5),
                                      off(60, 1.0),     off(72, 1.2),
                                      off(60, 2.0),     on(64, 80, 2.5),
                                      off(67, 3.0)};
  const std::vector<midi::Note> notes = midi::pair_notes(events);
  REQUIRE(notes.size() == 3);

  CHECK(notes[0].note == 60);
  CHECK(notes[0].velocity == 100);
  CHECK(notes[0].duration == Approx(1.0)); // first on closed by first off
  CHECK(notes[1].start == Approx(0.5));
  CHECK(notes[1].duration == Approx(1.5));
  // Unterminated: sustains to the last event.
  CHECK(notes[2].note == 64);
  CHECK(notes[2].duration == Approx(0.5));
}
