// src/core/cancellation.hpp
// Cooperative cancellation for multi-step tasks on the event loop.
// The source side cancels; every step holding a token checks it first.

#pragma once
#include <memory>
#include <utility>

namespace core {

class CancellationToken {
public:
  CancellationToken() = default;
  bool cancelled() const { return !flag_ || *flag_; }

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<const bool> flag)
      : flag_(std::move(flag)) {}
  std::shared_ptr<const bool> flag_; // empty token counts as cancelled
};

class CancellationSource {
public:
  CancellationSource() : flag_(std::make_shared<bool>(false)) {}

  CancellationToken token() const { return CancellationToken(flag_); }
  void cancel() { *flag_ = true; }
  bool cancelled() const { return *flag_; }

private:
  std::shared_ptr<bool> flag_;
};

} // namespace core
