// src/app/console.hpp
// Console front end: a text beat indicator and the parser for typed commands.
//
// Commands, one per line:
//   on <note> <velocity>   off <note> [velocity]
//   stop   cancel   pause   resume

#pragma once
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "capture/beat_indicator.hpp"

namespace app {

class ConsoleIndicator : public capture::BeatIndicator {
public:
  void show_beat(unsigned beat, bool countIn) override {
    if (countIn) {
      std::cout << "  count-in " << beat << "\n";
    } else {
      std::cout << "  Beat " << beat << "\n";
    }
    std::cout.flush();
  }

  void reset() override { std::cout << "  --\n" << std::flush; }
};

enum class CommandKind { NoteOn, NoteOff, Stop, Cancel, Pause, Resume };

struct ConsoleCommand {
  CommandKind kind = CommandKind::Stop;
  int note = 0;
  int velocity = 0;
};

// Returns nullopt for blank or unrecognized lines.
inline std::optional<ConsoleCommand> parse_command(const std::string &line) {
  std::istringstream in(line);
  std::string word;
  if (!(in >> word))
    return std::nullopt;

  ConsoleCommand cmd;
  if (word == "on" || word == "off") {
    cmd.kind = word == "on" ? CommandKind::NoteOn : CommandKind::NoteOff;
    if (!(in >> cmd.note))
      return std::nullopt;
    if (!(in >> cmd.velocity)) {
      if (cmd.kind == CommandKind::NoteOn)
        return std::nullopt;
      cmd.velocity = 0;
    }
    return cmd;
  }
  if (word == "stop") {
    cmd.kind = CommandKind::Stop;
  } else if (word == "cancel") {
    cmd.kind = CommandKind::Cancel;
  } else if (word == "pause") {
    cmd.kind = CommandKind::Pause;
  } else if (word == "resume") {
    cmd.kind = CommandKind::Resume;
  } else {
    return std::nullopt;
  }
  return cmd;
}

} // namespace app
