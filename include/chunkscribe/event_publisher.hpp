#pragma once

#include "chunkscribe/notifier.hpp"
#include "chunkscribe/system_state.hpp"

#include <memory>
#include <string>

namespace chunkscribe {

/**
 * Records an event in the recent-events ring and forwards it to the notifier.
 * A failing notifier is logged; publish() itself never throws.
 */
class EventPublisher {
public:
    EventPublisher(std::shared_ptr<SystemState> state, std::shared_ptr<Notifier> notifier);

    void publish(const NotificationEvent& event);
    void publish(EventKind kind, const std::string& subject, const std::string& message);

private:
    std::shared_ptr<SystemState> state_;
    std::shared_ptr<Notifier> notifier_;
};

} // namespace chunkscribe
