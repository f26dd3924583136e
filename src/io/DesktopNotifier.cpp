/* @file DesktopNotifier.cpp
 * @brief forks notify-send through posix_spawnp and reaps it - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <cstring> // for strerror
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

// Linux headers
#include <errno.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h> // access()

// Chime headers
#include "io/DesktopNotifier.hpp"

extern char** environ;

using namespace chime::io;

DesktopNotifier::DesktopNotifier(std::string program, std::string appName)
    : program_(std::move(program)), appName_(std::move(appName)) {}

void DesktopNotifier::display(const std::string& title, const std::string& body) {
  std::string appFlag = "--app-name=" + appName_;
  std::string endOfOptions = "--"; // a title like "--help" is text, not a flag
  std::vector<char*> argv{ program_.data(),
                           appFlag.data(),
                           endOfOptions.data(),
                           const_cast<char*>(title.c_str()),
                           const_cast<char*>(body.c_str()),
                           nullptr };

  pid_t pid = -1;
  int rc = posix_spawnp(&pid, program_.c_str(), nullptr, nullptr, argv.data(), environ);
  if (rc != 0)
    throw std::runtime_error("[DesktopNotifier] spawn " + program_ + ": " + strerror(rc));

  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno == EINTR)
      continue; // interrupted → retry
    throw std::runtime_error(std::string("[DesktopNotifier] waitpid: ") + strerror(errno));
  }

  if (WIFEXITED(status) && WEXITSTATUS(status) == 0)
    return;

  std::ostringstream msg;
  msg << "[DesktopNotifier] " << program_;
  if (WIFEXITED(status))
    msg << " exited with status " << WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    msg << " killed by signal " << WTERMSIG(status);
  throw std::runtime_error(msg.str());
}

bool DesktopNotifier::isGranted() const {
  const char* bus = std::getenv("DBUS_SESSION_BUS_ADDRESS");
  return bus && *bus && programOnPath();
}

bool DesktopNotifier::request() {
  // nothing to prompt for on a freedesktop session; report what we have
  bool granted = isGranted();
  if (!granted)
    std::cerr << "[DesktopNotifier] no session bus or " << program_ << " not on PATH\n";
  return granted;
}

bool DesktopNotifier::programOnPath() const {
  if (program_.find('/') != std::string::npos)
    return ::access(program_.c_str(), X_OK) == 0;

  const char* path = std::getenv("PATH");
  if (!path)
    return false;

  std::istringstream dirs(path);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty())
      dir = ".";
    if (::access((dir + "/" + program_).c_str(), X_OK) == 0)
      return true;
  }
  return false;
}
