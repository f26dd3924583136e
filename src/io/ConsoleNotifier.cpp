#include "io/ConsoleNotifier.hpp"

#include <ostream>
#include <stdexcept>

using namespace chime::io;

ConsoleNotifier::ConsoleNotifier(std::ostream& out) : out_(out) {}

void ConsoleNotifier::display(const std::string& title, const std::string& body) {
  std::lock_guard lock(mtx_);
  out_ << "\a[ALARM] " << title << ": " << body << std::endl;
  if (!out_)
    throw std::runtime_error("[ConsoleNotifier] output stream rejected notification");
}
