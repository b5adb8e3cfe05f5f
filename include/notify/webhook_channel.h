#pragma once
#include <string>
#include "notify/http_channel.h"

namespace notify {

// Универсальный webhook (Slack-совместимый): POST {"text": message}.
// Снимок не отправляется. Пустой url = канал выключен.
class WebhookChannel : public HttpChannel {
public:
    struct Config {
        std::string url;
    };

    WebhookChannel(const Config& cfg, HttpClient& http, const HttpTimeouts& timeouts = {});

    bool enabled() const override { return !cfg_.url.empty(); }
    ChannelOutcome send(const std::string& message, const Snapshot* snapshot) override;

private:
    Config cfg_;
};

} // namespace notify
