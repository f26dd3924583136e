#pragma once
/** @file  NotifierGateway.hpp
 *  @brief Adapts a scheduler fire event to the external notifier.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>

namespace chime {
  namespace io {
    class Notifier;
  } // namespace io

  namespace core {

    /**
 * @class NotifierGateway
 * @brief Stateless pass-through; every failure comes out as `DeliveryError`.
 *
 *  * No retries here; `AlarmScheduler` decides when to try again.
 *  * Permission calls are forwarded for the API layer.
 */
    class NotifierGateway {
    public:
      explicit NotifierGateway(std::shared_ptr<io::Notifier> notifier);

      /// @throws DeliveryError if the back-end failed.
      void deliver(const std::string& title, const std::string& body);

      bool isGranted() const;
      bool request();

    private:
      std::shared_ptr<io::Notifier> notifier_;
    };

  } // namespace core
} // namespace chime
