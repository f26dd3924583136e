/* @file Logger.cpp
 * @brief worker thread that drains LogEvents into the CSV file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <iostream>

// Chime headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "core/TimeUtil.hpp"
#include "io/FileLogger.hpp"

using namespace chime::core;

namespace {
  constexpr std::chrono::milliseconds kPollInterval{ 100 };
} // namespace

Logger::Logger(std::size_t capacity) : capacity_(capacity) {}

Logger::~Logger() { stop(); }

bool Logger::start(const std::string& path) {
  std::lock_guard lock(lifecycleMtx_);
  if (running_)
    return true;

  auto file = std::make_unique<io::FileLogger>();
  if (!file->open(path)) {
    std::cerr << "[Logger] event log disabled, cannot open " << path << "\n";
    return false;
  }

  file_ = std::move(file);
  buffer_ = std::make_unique<RingBuffer<LogEvent>>(capacity_);
  running_ = true;
  worker_ = std::thread(&Logger::drain, this);
  return true;
}

void Logger::log(const LogEvent& event) {
  if (!running_)
    return;
  buffer_->push(event);
}

void Logger::stop() {
  std::lock_guard lock(lifecycleMtx_);
  if (!running_)
    return;

  running_ = false;
  buffer_->close();
  if (worker_.joinable())
    worker_.join();
  file_->close();
}

std::size_t Logger::dropped() const { return buffer_ ? buffer_->dropped() : 0; }

std::string Logger::toCsv(const LogEvent& event) {
  std::string detail;
  detail.reserve(event.detail.size() + 2);
  detail += '"';
  for (char c : event.detail) {
    if (c == '"')
      detail += '"'; // RFC 4180 escape
    detail += c;
  }
  detail += '"';

  return std::to_string(toEpochMillis(event.at)) + "," + std::to_string(event.alarmId) + "," +
         event.event + "," + detail + "\n";
}

void Logger::drain() {
  // keep pulling until the buffer is closed *and* empty so stop() loses nothing already queued
  while (true) {
    auto next = buffer_->popFor(kPollInterval);
    if (next) {
      file_->write(toCsv(*next));
      continue;
    }
    if (buffer_->closed() && buffer_->empty())
      break;
    file_->flush(); // idle tick
  }
  file_->flush();
}
