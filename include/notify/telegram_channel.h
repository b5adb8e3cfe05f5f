#pragma once
#include <string>
#include "notify/http_channel.h"

namespace notify {

// Telegram Bot API.
//  - со снимком: multipart sendPhoto (chat_id, caption, photo)
//  - без снимка: form sendMessage (chat_id, text)
// Нужны и token, и chat_id, иначе канал выключен.
// Токен входит в URL, поэтому URL никогда не попадает в лог и в причину ошибки.
class TelegramChannel : public HttpChannel {
public:
    struct Config {
        std::string token;
        std::string chat_id;
        std::string api_base = "https://api.telegram.org";
    };

    TelegramChannel(const Config& cfg, HttpClient& http, const HttpTimeouts& timeouts = {});

    bool enabled() const override { return !cfg_.token.empty() && !cfg_.chat_id.empty(); }
    ChannelOutcome send(const std::string& message, const Snapshot* snapshot) override;

private:
    std::string method_url(const char* method) const;

    Config cfg_;
};

} // namespace notify
