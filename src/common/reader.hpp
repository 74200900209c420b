// src/common/reader.hpp
// Tiny safe cursor for big-endian reads + MIDI VLQ.
// Reads never go past the end of the buffer: every overrun raises
// midi::MalformedFileError so a chunk can never bleed into its neighbour.
#pragma once
#include <cstdint>
#include <vector>

#include "midi/errors.hpp"

struct Bytes {
  std::vector<std::uint8_t> data;
  std::size_t off = 0; // current read position

  explicit Bytes(const std::vector<std::uint8_t> &src) : data(src), off(0) {}
  explicit Bytes(std::vector<std::uint8_t> &&src)
      : data(std::move(src)), off(0) {}

  [[nodiscard]] std::size_t remaining() const { return data.size() - off; }
  [[nodiscard]] bool at_end() const { return off >= data.size(); }

  [[nodiscard]] std::uint8_t u8() {
    if (off + 1 > data.size())
      throw midi::MalformedFileError("EOF while reading u8");
    return data[off++];
  }

  [[nodiscard]] std::uint16_t be16() {
    if (off + 2 > data.size())
      throw midi::MalformedFileError("EOF while reading be16");
    std::uint16_t hi = data[off], lo = data[off + 1];
    off += 2;
    return static_cast<std::uint16_t>((hi << 8) | lo);
  }

  [[nodiscard]] std::uint32_t be32() {
    if (off + 4 > data.size())
      throw midi::MalformedFileError("EOF while reading be32");
    std::uint32_t b0 = data[off], b1 = data[off + 1], b2 = data[off + 2],
                  b3 = data[off + 3];
    off += 4;
    return (b0 << 24) | (b1 << 16) | (b2 << 8) | b3;
  }

  void skip(std::size_t n) {
    if (n > remaining())
      throw midi::MalformedFileError("EOF while skipping bytes");
    off += n;
  }

  // Carve the next n bytes out as an independent cursor and step over them.
  [[nodiscard]] Bytes take(std::size_t n) {
    if (n > remaining())
      throw midi::MalformedFileError("Chunk length exceeds file size");
    std::vector<std::uint8_t> slice(data.begin() + off,
                                    data.begin() + off + n);
    off += n;
    return Bytes(std::move(slice));
  }
};

// Read a MIDI VLQ (Variable Length Quantity). At most 4 bytes; a fourth byte
// that still carries the continuation bit is malformed.
inline std::uint32_t read_vlq(Bytes &r) {
  std::uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    std::uint8_t b = r.u8();
    v = (v << 7) | (b & 0x7F);
    if ((b & 0x80) == 0)
      return v; // high bit 0 => last byte
  }
  throw midi::MalformedFileError("VLQ longer than 4 bytes");
}
