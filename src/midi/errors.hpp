// src/midi/errors.hpp
// Error types raised by the SMF codec.
// Both are std::runtime_error so callers that only care about "it failed" can
// catch the base type, exactly like the rest of the app.

#pragma once
#include <stdexcept>
#include <string>

namespace midi {

// Encoding was asked to serialize a capture with no events.
struct EmptyCaptureError : std::runtime_error {
  EmptyCaptureError() : std::runtime_error("No notes recorded") {}
};

// Bytes handed to the decoder are not a well-formed SMF (bad magic, declared
// length past the buffer, truncated data, unsupported timing division).
struct MalformedFileError : std::runtime_error {
  explicit MalformedFileError(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace midi
