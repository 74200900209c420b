// src/app/line_input.hpp
// Non-blocking line reader for stdin, polled from the event loop so the whole
// app stays on one thread. POSIX only (poll + read).

#pragma once
#include <string>
#include <vector>

#include <poll.h>
#include <unistd.h>

namespace app {

class LineInput {
public:
  // Complete lines that arrived since the last call.
  std::vector<std::string> take_lines() {
    std::vector<std::string> lines;
    while (!eof_ && readable()) {
      char buf[256];
      const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
      if (n <= 0) {
        eof_ = true;
        break;
      }
      pending_.append(buf, static_cast<std::size_t>(n));
    }

    std::size_t pos = 0;
    for (std::size_t nl; (nl = pending_.find('\n', pos)) != std::string::npos;
         pos = nl + 1) {
      lines.push_back(pending_.substr(pos, nl - pos));
    }
    pending_.erase(0, pos);
    if (eof_ && !pending_.empty()) {
      lines.push_back(pending_);
      pending_.clear();
    }
    return lines;
  }

  bool eof() const { return eof_; }

private:
  static bool readable() {
    pollfd fd{STDIN_FILENO, POLLIN, 0};
    return ::poll(&fd, 1, 0) > 0 && (fd.revents & (POLLIN | POLLHUP)) != 0;
  }

  std::string pending_;
  bool eof_ = false;
};

} // namespace app
