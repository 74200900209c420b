// tests/recorder_tests.cpp
// Note capture under fixed-duration and silence-timeout policies.

#include <catch2/catch.hpp>

#include <vector>

#include "capture/recorder.hpp"
#include "midi/smf.hpp"
#include "support/fakes.hpp"

using capture::RecordMode;
using capture::RecorderState;
using testing::advance;
using testing::ManualTime;

namespace {

struct RecorderRig {
  ManualTime time;
  core::EventLoop loop{time};
  capture::NoteEventRecorder recorder{loop};
  int autoStops = 0;
  std::size_t autoStopEvents = 0;

  RecorderRig() {
    recorder.on_auto_stop([this](const std::vector<midi::NoteEvent> &events) {
      ++autoStops;
      autoStopEvents = events.size();
    });
  }

  void play(int note, int vel, bool isOn) {
    recorder.add_note(note, vel, loop.now_ms(), isOn);
  }
};

} // namespace

TEST_CASE("NoteEventRecorder: fixed two second take", "[capture][recorder]") {
  RecorderRig rig;
  rig.time.ms = 10000; // session start is not the clock origin
  rig.recorder.start_recording(RecordMode::FixedDuration, 2.0);

  advance(rig.time, rig.loop, 100);
  rig.play(60, 100, true);
  advance(rig.time, rig.loop, 400);
  rig.play(60, 100, false);

  advance(rig.time, rig.loop, 1499);
  CHECK(rig.recorder.is_recording());
  advance(rig.time, rig.loop, 1);
  CHECK(rig.recorder.state() == RecorderState::Stopped);
  CHECK(rig.autoStops == 1);
  CHECK(rig.autoStopEvents == 2);

  const std::vector<midi::NoteEvent> events = rig.recorder.stop_recording();
  REQUIRE(events.size() == 2);
  CHECK(events[0].note == 60);
  CHECK(events[0].velocity == 100);
  CHECK(events[0].isNoteOn);
  CHECK(events[0].time == Approx(0.1));
  CHECK_FALSE(events[1].isNoteOn);
  CHECK(events[1].time == Approx(0.5));

  midi::TempoConfig tempo;
  const midi::Song song =
      midi::decode_smf(midi::encode_smf(events, tempo), tempo);
  REQUIRE(song.events.size() == 2);
  CHECK(song.events[0].time == Approx(0.0));
  CHECK(song.events[1].time == Approx(0.4));
  CHECK(song.events[0].isNoteOn);
  CHECK_FALSE(song.events[1].isNoteOn);
}

TEST_CASE("NoteEventRecorder: notes outside a session are ignored",
          "[capture][recorder]") {
  RecorderRig rig;
  rig.play(60, 100, true);
  CHECK(rig.recorder.session().events.empty());
  CHECK(rig.recorder.stop_recording().empty());
  CHECK(rig.recorder.state() == RecorderState::Idle);

  rig.recorder.start_recording(RecordMode::FixedDuration, 1.0);
  advance(rig.time, rig.loop, 1000);
  rig.play(62, 100, true); // after the timer stopped the take
  CHECK(rig.recorder.stop_recording().empty());
}

TEST_CASE("NoteEventRecorder: silence timeout re-arms on note-on only",
          "[capture][recorder]") {
  RecorderRig rig;
  rig.recorder.start_recording(RecordMode::SilenceTimeout);

  SECTION("each note-on pushes the deadline out") {
    advance(rig.time, rig.loop, 1500);
    rig.play(60, 90, true);
    advance(rig.time, rig.loop, 1900);
    CHECK(rig.recorder.is_recording());
    advance(rig.time, rig.loop, 100);
    CHECK(rig.recorder.state() == RecorderState::Stopped);
  }

  SECTION("note-off does not extend the take") {
    advance(rig.time, rig.loop, 1000);
    rig.play(60, 90, true);
    advance(rig.time, rig.loop, 1500);
    rig.play(60, 0, false);
    advance(rig.time, rig.loop, 500);
    CHECK(rig.recorder.state() == RecorderState::Stopped);
    CHECK(rig.recorder.session().events.size() == 2);
  }

  SECTION("no input at all stops after the timeout") {
    advance(rig.time, rig.loop, 2000);
    CHECK(rig.recorder.state() == RecorderState::Stopped);
    CHECK(rig.autoStops == 1);
  }
}

TEST_CASE("NoteEventRecorder: restarting drops the previous take's timers",
          "[capture][recorder]") {
  RecorderRig rig;
  rig.recorder.start_recording(RecordMode::FixedDuration, 1.0);
  rig.play(60, 100, true);
  rig.recorder.start_recording(RecordMode::FixedDuration, 5.0);

  CHECK(rig.recorder.session().events.empty());
  CHECK(rig.loop.pending_count() == 1);

  advance(rig.time, rig.loop, 1500);
  CHECK(rig.recorder.is_recording());
  advance(rig.time, rig.loop, 3500);
  CHECK(rig.recorder.state() == RecorderState::Stopped);
  CHECK(rig.autoStops == 1);
}

TEST_CASE("NoteEventRecorder: cancel discards the take", "[capture][recorder]") {
  RecorderRig rig;
  rig.recorder.start_recording(RecordMode::FixedDuration, 2.0);
  advance(rig.time, rig.loop, 100);
  rig.play(60, 100, true);
  rig.play(60, 100, false);

  CHECK(rig.recorder.cancel_recording());
  CHECK(rig.recorder.state() == RecorderState::Canceled);
  CHECK(rig.recorder.session().canceled);
  CHECK(rig.recorder.session().events.empty());
  CHECK(rig.loop.pending_count() == 0);

  CHECK(rig.recorder.stop_recording().empty());
  CHECK_FALSE(rig.recorder.captured().has_value());
  CHECK_FALSE(rig.recorder.cancel_recording());

  advance(rig.time, rig.loop, 5000);
  CHECK(rig.autoStops == 0);
}

TEST_CASE("NoteEventRecorder: stop is idempotent", "[capture][recorder]") {
  RecorderRig rig;
  rig.recorder.start_recording(RecordMode::SilenceTimeout);
  rig.play(64, 80, true);

  const auto first = rig.recorder.stop_recording();
  const auto second = rig.recorder.stop_recording();
  CHECK(first.size() == 1);
  CHECK(second.size() == first.size());
  CHECK(rig.loop.pending_count() == 0);
  REQUIRE(rig.recorder.captured().has_value());
  CHECK(rig.recorder.captured()->size() == 1);

  advance(rig.time, rig.loop, 5000);
  CHECK(rig.autoStops == 0);
}

TEST_CASE("NoteEventRecorder: guards its inputs", "[capture][recorder]") {
  RecorderRig rig;
  CHECK_THROWS_AS(rig.recorder.start_recording(RecordMode::FixedDuration, 0.0),
                  std::invalid_argument);
  CHECK(rig.recorder.state() == RecorderState::Idle);

  rig.time.ms = 1000;
  rig.recorder.start_recording(RecordMode::FixedDuration, 3.0);
  rig.recorder.add_note(128, 100, rig.loop.now_ms(), true);
  rig.recorder.add_note(60, -1, rig.loop.now_ms(), true);
  CHECK(rig.recorder.session().events.empty());

  // A timestamp from just before the session started lands at zero.
  rig.recorder.add_note(60, 100, 990.0, true);
  REQUIRE(rig.recorder.session().events.size() == 1);
  CHECK(rig.recorder.session().events[0].time == 0.0);
}

TEST_CASE("NoteEventRecorder: a note-on at velocity 0 is a note-off",
          "[capture][recorder]") {
  RecorderRig rig;
  rig.recorder.start_recording(RecordMode::SilenceTimeout);
  rig.play(60, 100, true);
  advance(rig.time, rig.loop, 1500);
  rig.play(60, 0, true); // running-status style release

  const auto &events = rig.recorder.session().events;
  REQUIRE(events.size() == 2);
  CHECK(events[1].note == 60);
  CHECK_FALSE(events[1].isNoteOn);

  // Releases do not keep the take alive.
  advance(rig.time, rig.loop, 500);
  CHECK(rig.recorder.state() == RecorderState::Stopped);

  const auto notes = midi::pair_notes(rig.recorder.stop_recording());
  REQUIRE(notes.size() == 1);
  CHECK(notes[0].duration == Approx(1.5));
}
