// src/midi/notes.cpp
// Turn a flat on/off event list into sustained notes for scheduling.

#include "midi/smf.hpp"

#include <algorithm>
#include <array>
#include <deque>
#include <vector>

namespace midi {

std::vector<Note> pair_notes(const std::vector<NoteEvent> &events) {
  std::vector<Note> notes;
  notes.reserve(events.size() / 2 + 1);

  // Indices into `notes` of still-open note-ons, per pitch.
  std::array<std::deque<std::size_t>, 128> open;
  double lastTime = 0.0;

  for (const auto &ev : events) {
    lastTime = std::max(lastTime, ev.time);
    auto &pending = open[ev.note & 0x7F];
    if (ev.isNoteOn) {
      pending.push_back(notes.size());
      notes.push_back(Note{ev.note, ev.velocity, ev.time, 0.0});
    } else if (!pending.empty()) {
      Note &n = notes[pending.front()];
      pending.pop_front();
      n.duration = std::max(0.0, ev.time - n.start);
    }
    // A stray note-off has nothing to close.
  }

  for (const auto &pending : open) {
    for (std::size_t idx : pending) {
      notes[idx].duration = std::max(0.0, lastTime - notes[idx].start);
    }
  }

  std::stable_sort(notes.begin(), notes.end(),
                   [](const Note &a, const Note &b) { return a.start < b.start; });
  return notes;
}

} // namespace midi
