// src/core/event_loop.cpp

#include "core/event_loop.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

#include <spdlog/spdlog.h>

namespace core {

TimerId EventLoop::set_timeout(double delayMs, Callback cb) {
  const TimerId id = nextId_++;
  const Key key{time_.now_ms() + std::max(0.0, delayMs), id};
  queue_.emplace(key, std::move(cb));
  index_.emplace(id, key);
  return id;
}

bool EventLoop::clear_timeout(TimerId id) {
  auto it = index_.find(id);
  if (it == index_.end())
    return false;
  queue_.erase(it->second);
  index_.erase(it);
  return true;
}

bool EventLoop::pending(TimerId id) const {
  return index_.find(id) != index_.end();
}

std::optional<double> EventLoop::next_deadline() const {
  if (queue_.empty())
    return std::nullopt;
  return queue_.begin()->first.first;
}

std::size_t EventLoop::run_due() {
  std::size_t fired = 0;
  const double now = time_.now_ms();
  while (!queue_.empty() && queue_.begin()->first.first <= now) {
    auto it = queue_.begin();
    Callback cb = std::move(it->second);
    index_.erase(it->first.second);
    queue_.erase(it);
    ++fired;
    try {
      cb();
    } catch (const std::exception &ex) {
      spdlog::error("timer callback failed: {}", ex.what());
    }
  }
  return fired;
}

void EventLoop::run(const std::function<bool()> &keepGoing, double idleMs) {
  while (keepGoing()) {
    run_due();
    double waitMs = idleMs;
    if (auto next = next_deadline()) {
      waitMs = std::clamp(*next - time_.now_ms(), 0.0, idleMs);
    }
    if (waitMs > 0.0) {
      std::this_thread::sleep_for(
          std::chrono::duration<double, std::milli>(waitMs));
    }
  }
}

} // namespace core
