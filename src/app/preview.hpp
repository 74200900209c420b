// src/app/preview.hpp
// Pretty, compact console preview of a decoded MIDI file.
// - Prints SMF header summary
// - Prints the first 10 NoteOn/NoteOff events with timestamps (s)

#pragma once
#include <algorithm>
#include <iomanip>
#include <iostream>

#include "midi/events.hpp"

namespace app {

inline void print_preview(const midi::Song &song, std::ostream &out = std::cout) {
  out << "SMF header:\n";
  out << "  format  = " << song.header.format << "\n";
  out << "  nTracks = " << song.header.nTracks << "\n";
  out << "  PPQN    = " << song.header.ppqn << " ticks/qn\n";
  out << "  length  = " << std::fixed << std::setprecision(3) << song.length
      << "s, " << song.events.size() << " note events\n";

  out << "\nFirst 10 note events with time:\n";
  const std::size_t limit = std::min<std::size_t>(10, song.events.size());
  for (std::size_t i = 0; i < limit; ++i) {
    const auto &ev = song.events[i];
    out << "t=" << std::fixed << std::setprecision(3) << ev.time << "s  "
        << (ev.isNoteOn ? "On " : "Off") << " note=" << int(ev.note)
        << " vel=" << int(ev.velocity) << "\n";
  }
}

} // namespace app
