// src/io/io.hpp
// Whole-file binary I/O: read a .mid into memory, write an exported take.
//
// Usage:
//   auto bytes = io::read_all(path);
//   io::write_all(path, bytes);
//
// Throws std::runtime_error on errors.

#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ios>
#include <stdexcept>
#include <string>
#include <vector>

namespace io {

inline std::vector<std::uint8_t> read_all(const std::filesystem::path &p) {
  const std::string path = p.string();
  std::ifstream f(p, std::ios::binary);
  if (!f) {
    throw std::runtime_error("Could not open file: " + path);
  }
  f.seekg(0, std::ios::end);
  std::streamsize sz = f.tellg();
  if (sz < 0) {
    throw std::runtime_error("Could not get size of file: " + path);
  }
  std::vector<std::uint8_t> buf(static_cast<std::size_t>(sz));
  f.seekg(0, std::ios::beg);
  if (sz && !f.read(reinterpret_cast<char *>(buf.data()), sz)) {
    throw std::runtime_error("Could not read file: " + path);
  }
  return buf;
}

// Writes the whole blob or throws; a failed write never leaves a partial file
// behind under the target name.
inline void write_all(const std::filesystem::path &p,
                      const std::vector<std::uint8_t> &bytes) {
  const std::filesystem::path tmp = p.string() + ".part";
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) {
      throw std::runtime_error("Could not create file: " + tmp.string());
    }
    f.write(reinterpret_cast<const char *>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
    if (!f) {
      throw std::runtime_error("Could not write file: " + tmp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("Could not move file into place: " + p.string());
  }
}

} // namespace io
