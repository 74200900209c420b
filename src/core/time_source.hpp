// src/core/time_source.hpp
// Millisecond clock behind the cooperative event loop.
// The application uses the steady clock; tests drive a manual one.

#pragma once
#include <chrono>

namespace core {

class TimeSource {
public:
  virtual ~TimeSource() = default;
  // Monotonic milliseconds since an arbitrary origin.
  virtual double now_ms() const = 0;
};

class SteadyTimeSource : public TimeSource {
public:
  SteadyTimeSource() : origin_(std::chrono::steady_clock::now()) {}

  double now_ms() const override {
    return std::chrono::duration<double, std::milli>(
               std::chrono::steady_clock::now() - origin_)
        .count();
  }

private:
  std::chrono::steady_clock::time_point origin_;
};

} // namespace core
