#pragma once
#include <string>
#include "notify/http_channel.h"

namespace notify {

// Discord webhook с поддержкой вложений.
//  - со снимком: multipart (content, username, file)
//  - без снимка: JSON {"content", "username"}
// Любой статус >= 300 считается failed (пишется в лог, не бросается).
class DiscordChannel : public HttpChannel {
public:
    struct Config {
        std::string url;
        std::string username = "SmartCam";   // отображаемое имя бота
    };

    DiscordChannel(const Config& cfg, HttpClient& http, const HttpTimeouts& timeouts = {});

    bool enabled() const override { return !cfg_.url.empty(); }
    ChannelOutcome send(const std::string& message, const Snapshot* snapshot) override;

private:
    Config cfg_;
};

} // namespace notify
