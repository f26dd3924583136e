#include "core/NotifierFactory.hpp"

#include <algorithm>
#include <stdexcept>

#include "io/Notifier.hpp"

using namespace chime::core;

bool NotifierFactory::registerNotifier(const std::string& name, Creator maker) {
  return creators_.emplace(name, std::move(maker)).second;
}

std::shared_ptr<chime::io::Notifier> NotifierFactory::create(const std::string& name) const {
  auto it = creators_.find(name);
  if (it == creators_.end()) {
    std::string known;
    for (const auto& n : names())
      known += (known.empty() ? "" : ", ") + n;
    throw std::out_of_range("[NotifierFactory] unknown notifier '" + name + "' (known: " + known +
                            ")");
  }
  return it->second();
}

std::vector<std::string> NotifierFactory::names() const {
  std::vector<std::string> out;
  out.reserve(creators_.size());
  for (const auto& [name, _] : creators_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}
