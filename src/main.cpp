// src/main.cpp
// Orchestrates the app:
//   record: count-in, capture typed notes, write an SMF
//   play  : forced-duration playback of an SMF, optionally looped
//   dump  : print the decoded contents of an SMF

#include <cstdint>
#include <exception>
#include <iostream>
#include <vector>

#include <spdlog/spdlog.h>

#include "app/cli.hpp"
#include "app/console.hpp"
#include "app/line_input.hpp"
#include "app/logging.hpp"
#include "app/preview.hpp"
#include "audio/miniaudio_engine.hpp"
#include "audio/player.hpp"
#include "capture/beat_clock.hpp"
#include "capture/capture_session.hpp"
#include "capture/recorder.hpp"
#include "core/event_loop.hpp"
#include "core/time_source.hpp"
#include "io/io.hpp"
#include "midi/smf.hpp"
#include "midi/tempo.hpp"

namespace {

constexpr double kInputPollMs = 5.0;
// Fixed takes get a little headroom past the 16 beats so the last notes are
// never cut off.
constexpr double kTakeBufferSeconds = 3.0;

// Re-arming timer that feeds typed lines to `handle`. End of input counts as
// 'stop' when `stopOnEof` is set (piped takes), otherwise polling just ends.
template <typename Handler>
void poll_input(core::EventLoop &loop, app::LineInput &input, bool stopOnEof,
                Handler handle) {
  for (const auto &line : input.take_lines()) {
    if (auto cmd = app::parse_command(line)) {
      handle(*cmd);
    } else if (!line.empty()) {
      spdlog::warn("unrecognized input: '{}'", line);
    }
  }
  if (input.eof()) {
    if (stopOnEof) {
      app::ConsoleCommand stop;
      stop.kind = app::CommandKind::Stop;
      handle(stop);
    }
    return;
  }
  loop.set_timeout(kInputPollMs, [&loop, &input, stopOnEof, handle] {
    poll_input(loop, input, stopOnEof, handle);
  });
}

int run_record(const app::Cli &cli, const midi::TempoConfig &tempo) {
  core::SteadyTimeSource time;
  core::EventLoop loop(time);
  audio::MiniaudioEngine engine(cli.soundFont);
  capture::BeatClock clock(loop, engine, tempo);
  capture::NoteEventRecorder recorder(loop);
  capture::CaptureSession session(loop, clock, recorder, tempo);
  app::ConsoleIndicator indicator;
  clock.set_indicator(&indicator);

  const double duration =
      cli.duration.value_or(tempo.target_duration() + kTakeBufferSeconds);
  std::cout << "Type 'on <note> <vel>' / 'off <note>', 'stop' or 'cancel'.\n";
  session.begin(cli.mode, duration, cli.countIn);

  app::LineInput input;
  poll_input(loop, input, true, [&session](const app::ConsoleCommand &cmd) {
    switch (cmd.kind) {
    case app::CommandKind::NoteOn:
      session.note_on(cmd.note, cmd.velocity);
      break;
    case app::CommandKind::NoteOff:
      session.note_off(cmd.note, cmd.velocity);
      break;
    case app::CommandKind::Stop:
      session.finish();
      break;
    case app::CommandKind::Cancel:
      session.cancel();
      break;
    default:
      break;
    }
  });

  loop.run([&session] {
    return session.state() == capture::SessionState::CountingIn ||
           session.state() == capture::SessionState::Recording;
  });
  clock.stop();

  if (session.state() == capture::SessionState::Canceled) {
    std::cout << "Take canceled, nothing written.\n";
    return 0;
  }

  const auto bytes = session.export_file(
      cli.padded ? midi::EncodeMode::PlaybackPadded : midi::EncodeMode::Export);
  if (!bytes) {
    std::cout << "Nothing to export.\n";
    return 1;
  }
  io::write_all(cli.midiPath, *bytes);
  std::cout << "Wrote " << bytes->size() << " bytes to " << cli.midiPath.string()
            << "\n";
  return 0;
}

int run_play(const app::Cli &cli, const midi::TempoConfig &tempo) {
  const std::vector<std::uint8_t> bytes = io::read_all(cli.midiPath);

  core::SteadyTimeSource time;
  core::EventLoop loop(time);
  audio::MiniaudioEngine engine(cli.soundFont);
  audio::PlaybackScheduler player(loop, engine, tempo);

  bool done = false;
  player.on_finished([&done] { done = true; });

  if (cli.loopCount == 1) {
    player.play(bytes, cli.duration);
  } else {
    player.play_with_loop(bytes, cli.loopCount, cli.duration);
  }

  app::LineInput input;
  poll_input(loop, input, false, [&player, &done](const app::ConsoleCommand &cmd) {
    switch (cmd.kind) {
    case app::CommandKind::Pause:
      player.pause();
      break;
    case app::CommandKind::Resume:
      player.resume();
      break;
    case app::CommandKind::Stop:
    case app::CommandKind::Cancel:
      player.stop();
      done = true;
      break;
    default:
      break;
    }
  });

  loop.run([&done] { return !done; });
  player.stop();
  return 0;
}

int run_dump(const app::Cli &cli, const midi::TempoConfig &tempo) {
  const auto bytes = io::read_all(cli.midiPath);
  app::print_preview(midi::decode_smf(bytes, tempo));
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  try {
    const app::Cli cli = app::parse_cli(argc, argv);
    app::init_logging(cli.verbose);

    midi::TempoConfig tempo;
    tempo.bpm = cli.bpm;
    midi::validate(tempo);

    switch (cli.command) {
    case app::Command::Record:
      return run_record(cli, tempo);
    case app::Command::Play:
      return run_play(cli, tempo);
    case app::Command::Dump:
      return run_dump(cli, tempo);
    }
    return 2;
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
