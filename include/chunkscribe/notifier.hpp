#pragma once

#include <string>

namespace chunkscribe {

enum class EventKind {
    MergeCompleted,
    ModuleFinished,
    CourseFinished,
    Error
};

inline const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::MergeCompleted: return "merge_completed";
        case EventKind::ModuleFinished: return "module_finished";
        case EventKind::CourseFinished: return "course_finished";
        case EventKind::Error: return "error";
    }
    return "unknown";
}

struct NotificationEvent {
    EventKind kind;
    std::string subject;   // group id, "course/module", course name or error context
    std::string message;
};

// Delivery is fire-and-forget from the pipeline's point of view.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const NotificationEvent& event) = 0;
};

class NullNotifier : public Notifier {
public:
    void notify(const NotificationEvent&) override {}
};

} // namespace chunkscribe
