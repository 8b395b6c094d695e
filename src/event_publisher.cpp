#include "chunkscribe/event_publisher.hpp"

#include "chunkscribe/logging.hpp"

namespace chunkscribe {

EventPublisher::EventPublisher(std::shared_ptr<SystemState> state, std::shared_ptr<Notifier> notifier)
    : state_(std::move(state)), notifier_(std::move(notifier)) {}

void EventPublisher::publish(const NotificationEvent& event) {
    LOG_INFO("Event ", to_string(event.kind), ": ", event.subject,
             event.message.empty() ? "" : " - ", event.message);

    if (state_) {
        state_->record_event(event);
    }
    if (!notifier_) {
        return;
    }
    try {
        notifier_->notify(event);
    } catch (const std::exception& e) {
        LOG_WARNING("Notification for ", event.subject, " not delivered: ", e.what());
    }
}

void EventPublisher::publish(EventKind kind, const std::string& subject, const std::string& message) {
    publish(NotificationEvent{kind, subject, message});
}

} // namespace chunkscribe
