// src/common/writer.hpp
// Append-only byte sink: the write-side twin of reader.hpp.
#pragma once
#include <cstdint>
#include <initializer_list>
#include <vector>

struct ByteWriter {
  std::vector<std::uint8_t> data;

  void u8(std::uint8_t v) { data.push_back(v); }

  void bytes(std::initializer_list<std::uint8_t> vs) {
    data.insert(data.end(), vs.begin(), vs.end());
  }

  void bytes(const std::vector<std::uint8_t> &vs) {
    data.insert(data.end(), vs.begin(), vs.end());
  }

  void be16(std::uint16_t v) {
    u8(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    u8(static_cast<std::uint8_t>(v & 0xFF));
  }

  void be32(std::uint32_t v) {
    u8(static_cast<std::uint8_t>((v >> 24) & 0xFF));
    u8(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    u8(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    u8(static_cast<std::uint8_t>(v & 0xFF));
  }

  [[nodiscard]] std::size_t size() const { return data.size(); }
};

// Write a MIDI VLQ: 7 bits per byte, most significant group first,
// continuation bit on every byte but the last.
inline void write_vlq(ByteWriter &w, std::uint32_t value) {
  std::uint8_t groups[5];
  int n = 0;
  groups[n++] = static_cast<std::uint8_t>(value & 0x7F);
  value >>= 7;
  while (value > 0) {
    groups[n++] = static_cast<std::uint8_t>((value & 0x7F) | 0x80);
    value >>= 7;
  }
  while (n > 0)
    w.u8(groups[--n]);
}
