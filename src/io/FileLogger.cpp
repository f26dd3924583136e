/* @file FileLogger.cpp
 * @brief buffered fwrite wrapper used by the event log worker
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Chime headers
#include "io/FileLogger.hpp"

using namespace chime::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), path_(std::move(other.path_)),
      buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    path_ = std::move(other.path_);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (!fp_) {
    std::cerr << "[FileLogger] open " << path << ": " << strerror(errno) << "\n";
    return false;
  }
  path_ = path;
  buffer_.reserve(kFlushThreshold);
  return true;
}

void FileLogger::write(const std::string& csv) {
  if (!fp_)
    return;
  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kFlushThreshold)
    flush();
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  std::size_t total = 0;
  while (total < buffer_.size()) {
    std::size_t n = std::fwrite(buffer_.data() + total, 1, buffer_.size() - total, fp_);
    if (n == 0) {
      std::cerr << "[FileLogger] fwrite " << path_ << ": " << strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(total));
      return false;
    }
    total += n;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
}
