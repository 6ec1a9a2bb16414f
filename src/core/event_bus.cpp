#include "listen_along/core/event_bus.hpp"
#include "listen_along/utils/logger.hpp"

namespace listen_along::core {

void EventBus::handle_exception(const std::string& event_type, const std::exception& e) {
    LOG_ERROR("EventBus", "Exception in event handler for " + event_type + ": " + e.what());
}

} // namespace listen_along::core
