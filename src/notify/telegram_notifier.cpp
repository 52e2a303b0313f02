#include <relsync/notify/notifier.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace relsync::notify {

using json = nlohmann::json;

TelegramNotifier::TelegramNotifier(std::shared_ptr<net::IHttpClient> http, TelegramConfig config)
    : http_(std::move(http)), config_(std::move(config)) {
    while (!config_.apiBase.empty() && config_.apiBase.back() == '/')
        config_.apiBase.pop_back();
}

Result<void> TelegramNotifier::send(std::string_view text) {
    if (!http_) {
        return Error{ErrorCode::InternalError, "TelegramNotifier has no http client"};
    }
    if (config_.token.empty()) {
        return Error{ErrorCode::InvalidArgument, "TelegramNotifier: empty bot token"};
    }

    const json body = {{"chat_id", config_.chatId}, {"text", std::string(text)}};
    const std::string url = config_.apiBase + "/bot" + config_.token + "/sendMessage";

    auto posted = http_->postJson(url, body.dump());
    if (!posted) {
        return Error{posted.error().code, "sendMessage failed: " + posted.error().message};
    }

    const auto& response = posted.value();
    auto reply = json::parse(response.body, nullptr, /*allow_exceptions=*/false);
    if (response.status < 200 || response.status >= 300) {
        std::string description;
        if (!reply.is_discarded() && reply.is_object())
            description = reply.value("description", std::string{});
        return Error{ErrorCode::ServerError, "sendMessage failed: HTTP " +
                                                 std::to_string(response.status) +
                                                 (description.empty() ? "" : " " + description)};
    }
    if (reply.is_discarded() || !reply.is_object() || !reply.value("ok", false)) {
        return Error{ErrorCode::InvalidData, "sendMessage failed: unexpected reply"};
    }

    spdlog::debug("notification delivered to chat {}", config_.chatId);
    return Result<void>();
}

std::shared_ptr<INotifier> makeTelegramNotifier(std::shared_ptr<net::IHttpClient> http,
                                                TelegramConfig config) {
    return std::make_shared<TelegramNotifier>(std::move(http), std::move(config));
}

void notifyBestEffort(INotifier* notifier, std::string_view text) {
    if (!notifier) {
        spdlog::warn("no notifier configured; dropping message");
        return;
    }
    auto sent = notifier->send(text);
    if (!sent) {
        spdlog::error("send message err: {}", sent.error().message);
    }
}

} // namespace relsync::notify
