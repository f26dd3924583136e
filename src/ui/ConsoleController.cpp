/* @file ConsoleController.cpp
 * @brief command parsing + dispatch onto AlarmService
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <exception>
#include <ostream>
#include <sstream>

// Chime headers
#include "core/AlarmService.hpp"
#include "core/Clock.hpp"
#include "core/TimeUtil.hpp"
#include "io/LineReader.hpp"
#include "ui/ConsoleController.hpp"

using namespace chime::ui;
using chime::core::AlarmId;
using chime::core::Instant;

namespace {

  bool allDigits(const std::string& s) {
    if (s.empty())
      return false;
    for (unsigned char c : s)
      if (!std::isdigit(c))
        return false;
    return true;
  }

  ConsoleCommand invalid(std::string why) {
    ConsoleCommand cmd;
    cmd.kind = ConsoleCommand::Kind::Invalid;
    cmd.error = std::move(why);
    return cmd;
  }

  std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos)
      return {};
    auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
  }

} // namespace

ConsoleController::ConsoleController(core::AlarmService& service, core::Clock& clock, int inFd,
                                     std::ostream& out)
    : service_(service), clock_(clock), inFd_(inFd), out_(out) {}

bool ConsoleController::serve(std::stop_token stop) {
  io::LineReader reader(inFd_);
  while (!stop.stop_requested()) {
    auto line = reader.readLine(kPollInterval);
    if (!line) {
      if (reader.eof())
        return false;
      continue;
    }
    if (!handleLine(*line))
      return true;
  }
  return false;
}

ConsoleCommand ConsoleController::parse(const std::string& line, Instant now) {
  std::istringstream in(line);
  std::string verb;
  if (!(in >> verb))
    return {};

  ConsoleCommand cmd;
  if (verb == "list") {
    cmd.kind = ConsoleCommand::Kind::List;
    return cmd;
  }
  if (verb == "help") {
    cmd.kind = ConsoleCommand::Kind::Help;
    return cmd;
  }
  if (verb == "quit" || verb == "exit") {
    cmd.kind = ConsoleCommand::Kind::Quit;
    return cmd;
  }

  if (verb == "add") {
    std::string when;
    if (!(in >> when))
      return invalid("usage: add <+seconds|YYYY-MM-DDTHH:MM:SSZ> <title>");

    if (when.front() == '+') {
      const std::string digits = when.substr(1);
      if (!allDigits(digits) || digits.size() > 9)
        return invalid("bad relative time '" + when + "'");
      cmd.when = now + std::chrono::seconds{ std::stoll(digits) };
    } else if (auto at = core::parseUtc(when)) {
      cmd.when = *at;
    } else {
      return invalid("bad time '" + when + "'");
    }

    std::string rest;
    std::getline(in, rest);
    cmd.title = trim(rest);
    if (cmd.title.empty())
      return invalid("usage: add <+seconds|YYYY-MM-DDTHH:MM:SSZ> <title>");
    cmd.kind = ConsoleCommand::Kind::Add;
    return cmd;
  }

  if (verb == "delete" || verb == "on" || verb == "off") {
    std::string id;
    if (!(in >> id) || !allDigits(id) || id.size() > 18)
      return invalid("usage: " + verb + " <id>");
    cmd.id = static_cast<AlarmId>(std::stoll(id));
    cmd.kind = verb == "delete" ? ConsoleCommand::Kind::Delete
               : verb == "on"   ? ConsoleCommand::Kind::On
                                : ConsoleCommand::Kind::Off;
    return cmd;
  }

  return invalid("unknown command '" + verb + "' (try help)");
}

bool ConsoleController::handleLine(const std::string& line) {
  const ConsoleCommand cmd = parse(line, clock_.now());

  try {
    switch (cmd.kind) {
    case ConsoleCommand::Kind::Add: {
      AlarmId id = service_.createAlarm(cmd.title, cmd.when);
      out_ << "created #" << id << " at " << core::formatUtc(cmd.when) << "\n";
      break;
    }
    case ConsoleCommand::Kind::List:
      printList();
      break;
    case ConsoleCommand::Kind::Delete:
      service_.deleteAlarm(cmd.id);
      out_ << "deleted #" << cmd.id << "\n";
      break;
    case ConsoleCommand::Kind::On:
    case ConsoleCommand::Kind::Off: {
      const bool on = cmd.kind == ConsoleCommand::Kind::On;
      service_.toggleAlarm(cmd.id, on);
      out_ << "#" << cmd.id << (on ? " on" : " off") << "\n";
      break;
    }
    case ConsoleCommand::Kind::Help:
      printHelp();
      break;
    case ConsoleCommand::Kind::Quit:
      return false;
    case ConsoleCommand::Kind::Empty:
      break;
    case ConsoleCommand::Kind::Invalid:
      out_ << "error: " << cmd.error << "\n";
      break;
    }
  } catch (const std::exception& e) {
    out_ << "error: " << e.what() << "\n";
  }
  out_.flush();
  return true;
}

void ConsoleController::printList() {
  const auto alarms = service_.listAlarms();
  if (alarms.empty()) {
    out_ << "no alarms\n";
    return;
  }
  for (const auto& view : alarms) {
    const auto& a = view.alarm;
    out_ << "#" << a.id << "  " << core::toString(view.status) << "  "
         << core::formatUtc(a.scheduledTime) << "  " << a.title;
    if (a.firedAt)
      out_ << "  (fired " << core::formatUtc(*a.firedAt) << ")";
    out_ << "\n";
  }
}

void ConsoleController::printHelp() {
  out_ << "add <+seconds|YYYY-MM-DDTHH:MM:SSZ> <title>  schedule an alarm\n"
       << "list                                        show all alarms\n"
       << "delete <id>                                 remove an alarm\n"
       << "on <id> | off <id>                          arm / disarm an alarm\n"
       << "quit                                        stop the daemon\n";
}
