#pragma once

#include <relsync/core/types.h>
#include <relsync/net/http_client.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace relsync::notify {

/**
 * Send-text capability. Implementations deliver one plain-text message to a single recipient.
 */
class INotifier {
public:
    virtual ~INotifier() = default;
    virtual Result<void> send(std::string_view text) = 0;
};

struct TelegramConfig {
    std::string apiBase{"https://api.telegram.org"};
    std::string token;
    std::uint64_t chatId{0};
};

/**
 * Telegram bot API notifier (sendMessage). The bot token is the bearer credential; it is part of
 * the request path and never logged.
 */
class TelegramNotifier final : public INotifier {
public:
    TelegramNotifier(std::shared_ptr<net::IHttpClient> http, TelegramConfig config);

    Result<void> send(std::string_view text) override;

private:
    std::shared_ptr<net::IHttpClient> http_;
    TelegramConfig config_;
};

std::shared_ptr<INotifier> makeTelegramNotifier(std::shared_ptr<net::IHttpClient> http,
                                                TelegramConfig config);

/**
 * Deliver text and log a failure instead of returning it. Never retries.
 */
void notifyBestEffort(INotifier* notifier, std::string_view text);

} // namespace relsync::notify
