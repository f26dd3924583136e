/* @file LineReader.cpp
 * @brief poll()-driven line framing over a borrowed fd - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <iostream>

// Linux headers
#include <errno.h>
#include <poll.h>
#include <unistd.h> // read()

// Chime headers
#include "io/LineReader.hpp"

using namespace chime::io;

LineReader::LineReader(int fd) : fd_(fd) {}

// -------------------------------------------------------------------
// LineReader::readLine
// Returns a buffered line first; otherwise polls until one completes,
// the timeout expires, or the peer closes.
// -------------------------------------------------------------------
std::optional<std::string> LineReader::readLine(std::chrono::milliseconds timeout) {
  if (auto line = takeLine())
    return line;
  if (fd_ < 0 || eof_)
    return std::nullopt;

  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = static_cast<int>(ms_left.count());

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "[LineReader] poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLIN | POLLHUP)) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF: hand back any unterminated tail
        eof_ = true;
        if (rx_buffer_.empty())
          return std::nullopt;
        std::string tail = std::move(rx_buffer_);
        rx_buffer_.clear();
        if (!tail.empty() && tail.back() == '\r')
          tail.pop_back();
        return tail;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        std::cerr << "[LineReader] read: " << strerror(errno) << '\n';
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;
    } else if (pfd.revents & (POLLERR | POLLNVAL)) {
      eof_ = true;
      return std::nullopt;
    }
  }
  return std::nullopt; // timeout/partial
}

std::optional<std::string> LineReader::takeLine() {
  auto pos = rx_buffer_.find('\n');
  if (pos == std::string::npos)
    return std::nullopt;

  std::string line = rx_buffer_.substr(0, pos);
  rx_buffer_.erase(0, pos + 1);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return line;
}
