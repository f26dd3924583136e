/* @file NotifierGateway.cpp
 * @brief maps back-end exceptions onto DeliveryError
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>

#include "core/Errors.hpp"
#include "core/NotifierGateway.hpp"
#include "io/Notifier.hpp"

using namespace chime::core;

NotifierGateway::NotifierGateway(std::shared_ptr<io::Notifier> notifier)
    : notifier_(std::move(notifier)) {
  if (!notifier_)
    throw std::invalid_argument("[NotifierGateway] notifier is nullptr");
}

void NotifierGateway::deliver(const std::string& title, const std::string& body) {
  try {
    notifier_->display(title, body);
  } catch (const DeliveryError&) {
    throw;
  } catch (const std::exception& e) {
    throw DeliveryError(e.what());
  }
}

bool NotifierGateway::isGranted() const { return notifier_->isGranted(); }

bool NotifierGateway::request() { return notifier_->request(); }
