#pragma once

#include "chunkscribe/config.hpp"
#include "chunkscribe/http_client.hpp"
#include "chunkscribe/notifier.hpp"

#include <memory>
#include <string>

namespace chunkscribe {

/**
 * Sends each event as a Telegram chat message through the Bot API.
 *
 * Without a token or chat id the notifier is disabled and notify() does
 * nothing. Delivery failures are logged and swallowed.
 */
class TelegramNotifier : public Notifier {
public:
    explicit TelegramNotifier(const TelegramConfig& config,
                              std::shared_ptr<HttpClient> client = nullptr);

    void notify(const NotificationEvent& event) override;

    // Returns false when disabled or when the API did not accept the message.
    bool send_message(const std::string& text);

    bool enabled() const { return enabled_; }

    static std::string format(const NotificationEvent& event);

private:
    TelegramConfig config_;
    bool enabled_;
    std::shared_ptr<HttpClient> client_;
};

} // namespace chunkscribe
