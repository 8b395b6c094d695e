#include "chunkscribe/telegram_notifier.hpp"

#include "chunkscribe/logging.hpp"

namespace chunkscribe {

namespace {

constexpr const char* kApiHost = "api.telegram.org";

} // namespace

TelegramNotifier::TelegramNotifier(const TelegramConfig& config, std::shared_ptr<HttpClient> client)
    : config_(config), enabled_(config.enabled()), client_(std::move(client)) {
    if (!enabled_) {
        LOG_WARNING("Telegram credentials not configured - notifications disabled");
        return;
    }
    if (!client_) {
        client_ = std::make_shared<HttpClient>(kApiHost, 443, true);
    }
    client_->set_timeout(static_cast<int>(config_.timeout_seconds));
    LOG_INFO("Telegram notifier initialized");
}

std::string TelegramNotifier::format(const NotificationEvent& event) {
    std::string text;
    switch (event.kind) {
        case EventKind::MergeCompleted: text = "Transcript finished: " + event.subject; break;
        case EventKind::ModuleFinished: text = "Module finished: " + event.subject; break;
        case EventKind::CourseFinished: text = "Course finished: " + event.subject; break;
        case EventKind::Error: text = "Error in " + event.subject; break;
    }
    if (!event.message.empty()) {
        text += "\n" + event.message;
    }
    return text;
}

void TelegramNotifier::notify(const NotificationEvent& event) {
    send_message(format(event));
}

bool TelegramNotifier::send_message(const std::string& text) {
    if (!enabled_) {
        return false;
    }

    const std::string target = "/bot" + config_.token + "/sendMessage";
    const std::string body = HttpClient::form_encode({{"chat_id", config_.chat_id}, {"text", text}});

    HttpResponse response;
    if (!client_->send_request("POST", target, body, "application/x-www-form-urlencoded", response)) {
        LOG_ERROR("Failed to send Telegram message");
        return false;
    }
    if (response.status != 200) {
        LOG_ERROR("Telegram API rejected message with status ", response.status, ": ", response.body);
        return false;
    }
    LOG_DEBUG("Telegram message sent: ", text.substr(0, 50));
    return true;
}

} // namespace chunkscribe
