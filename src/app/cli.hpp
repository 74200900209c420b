// src/app/cli.hpp
// Minimal, robust CLI parsing for our tiny main.
// Responsibilities:
//  - Pick the subcommand (record / play / dump).
//  - Parse the flags each subcommand understands.
//  - Validate paths and numbers early, with a clear error.
//
// Design notes:
//  * Header-only; we throw std::runtime_error on problems and main() prints.
//  * The tempo given here becomes the one TempoConfig the whole run shares.
//
// Usage:
//   midicap record [--mode fixed|silence] [--duration <s>] [--no-count-in]
//                  [--padded] [--out <file.mid>] [--bpm <n>] [--sf <path>]
//   midicap play <file.mid> [--duration <s>] [--loop <n>|inf] [--bpm <n>]
//                [--sf <path>]
//   midicap dump <file.mid> [--bpm <n>]
//   Every command also accepts -v/--verbose.

#pragma once
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "capture/recorder.hpp"

namespace app {

enum class Command { Record, Play, Dump };

struct Cli {
  Command command = Command::Dump;
  std::filesystem::path midiPath; // input for play/dump, output for record
  std::optional<std::filesystem::path> soundFont;
  double bpm = 100.0;

  // record
  capture::RecordMode mode = capture::RecordMode::FixedDuration;
  std::optional<double> duration; // record length, or play window
  bool countIn = true;
  bool padded = false;

  // play
  int loopCount = 1; // -1 = until stopped

  bool verbose = false;
};

inline std::string usage(const std::string &prog) {
  return "Usage:\n"
         "  " + prog + " record [--mode fixed|silence] [--duration <s>] "
         "[--no-count-in] [--padded] [--out <file.mid>] [--bpm <n>] "
         "[--sf <path>]\n"
         "  " + prog + " play <file.mid> [--duration <s>] [--loop <n>|inf] "
         "[--bpm <n>] [--sf <path>]\n"
         "  " + prog + " dump <file.mid> [--bpm <n>]\n"
         "Options:\n"
         "  -v, --verbose   debug logging\n";
}

// Small helper: true if s looks like a flag (starts with '-' and not just "-")
inline bool is_flag_like(const std::string &s) {
  return !s.empty() && s[0] == '-' && s != "-";
}

inline double parse_positive(const std::string &flag, const std::string &v) {
  std::size_t used = 0;
  double d = 0.0;
  try {
    d = std::stod(v, &used);
  } catch (const std::exception &) {
    throw std::runtime_error(flag + " expects a number, got '" + v + "'");
  }
  if (used != v.size() || !(d > 0.0)) {
    throw std::runtime_error(flag + " expects a positive number, got '" + v +
                             "'");
  }
  return d;
}

// Whole number >= 1; "2.5", "0" and out-of-range values are refused.
inline int parse_count(const std::string &flag, const std::string &v) {
  std::size_t used = 0;
  int n = 0;
  try {
    n = std::stoi(v, &used);
  } catch (const std::exception &) {
    throw std::runtime_error(flag + " expects a whole number, got '" + v + "'");
  }
  if (used != v.size() || n < 1) {
    throw std::runtime_error(flag + " expects a count of at least 1, got '" +
                             v + "'");
  }
  return n;
}

inline std::filesystem::path existing_file(const std::string &p) {
  std::filesystem::path path = p;
  if (!std::filesystem::exists(path) ||
      !std::filesystem::is_regular_file(path)) {
    throw std::runtime_error("File does not exist: " + path.string());
  }
  return std::filesystem::canonical(path);
}

// Parse argv into our Cli struct. Throws std::runtime_error on any invalid
// input (including --help, whose message is the usage text).
inline Cli parse_cli(int argc, char **argv) {
  const std::string prog = argc > 0 ? argv[0] : "midicap";
  if (argc < 2) {
    throw std::runtime_error(usage(prog));
  }

  Cli cli;
  const std::string cmd = argv[1];
  if (cmd == "record") {
    cli.command = Command::Record;
    cli.midiPath = "take.mid";
  } else if (cmd == "play") {
    cli.command = Command::Play;
  } else if (cmd == "dump") {
    cli.command = Command::Dump;
  } else if (cmd == "--help" || cmd == "-h") {
    throw std::runtime_error(usage(prog));
  } else {
    throw std::runtime_error("Unknown command: " + cmd + "\n" + usage(prog));
  }

  int i = 2;
  if (cli.command != Command::Record) {
    if (argc < 3 || is_flag_like(argv[2])) {
      throw std::runtime_error(cmd + " needs a MIDI file path");
    }
    cli.midiPath = existing_file(argv[2]);
    i = 3;
  }

  auto value = [&](const std::string &flag) -> std::string {
    if (i + 1 >= argc) {
      throw std::runtime_error(flag + " requires a value");
    }
    return argv[++i];
  };

  for (; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      throw std::runtime_error(usage(prog));
    } else if (a == "-v" || a == "--verbose") {
      cli.verbose = true;
    } else if (a == "--bpm") {
      cli.bpm = parse_positive(a, value(a));
    } else if (a == "--sf" && cli.command != Command::Dump) {
      cli.soundFont = existing_file(value(a));
    } else if (a == "--duration" && cli.command != Command::Dump) {
      cli.duration = parse_positive(a, value(a));
    } else if (a == "--mode" && cli.command == Command::Record) {
      const std::string m = value(a);
      if (m == "fixed") {
        cli.mode = capture::RecordMode::FixedDuration;
      } else if (m == "silence") {
        cli.mode = capture::RecordMode::SilenceTimeout;
      } else {
        throw std::runtime_error("--mode must be 'fixed' or 'silence'");
      }
    } else if (a == "--no-count-in" && cli.command == Command::Record) {
      cli.countIn = false;
    } else if (a == "--padded" && cli.command == Command::Record) {
      cli.padded = true;
    } else if (a == "--out" && cli.command == Command::Record) {
      cli.midiPath = value(a);
    } else if (a == "--loop" && cli.command == Command::Play) {
      const std::string n = value(a);
      cli.loopCount = n == "inf" ? -1 : parse_count(a, n);
    } else {
      // Unknown (or misplaced) flags are errors to avoid surprises.
      throw std::runtime_error("Unknown option for " + cmd + ": " + a);
    }
  }

  return cli;
}

} // namespace app
