#pragma once
/** @file  NotifierFactory.hpp
 *  @brief Runtime registry that maps notifier names to creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace chime::io {
  class Notifier;
}

namespace chime::core {

  /**
 * @class NotifierFactory
 * @brief Register & instantiate notifier back-ends by string key.
 *
 *  * Keeps SystemCoordinator decoupled from concrete notifiers.
 *  * Creators are lambdas returning `shared_ptr<Notifier>` (the gateway shares it).
 */
  class NotifierFactory {
  public:
    using Creator = std::function<std::shared_ptr<io::Notifier>()>;

    /// Register a notifier under \p name.  Returns false on duplicate.
    bool registerNotifier(const std::string &name, Creator maker);

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::shared_ptr<io::Notifier> create(const std::string &name) const;

    /// Registered names, sorted (for config error messages).
    std::vector<std::string> names() const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace chime::core
