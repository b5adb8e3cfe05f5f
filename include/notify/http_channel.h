#pragma once
#include <chrono>
#include <string>
#include "notify/channel.h"
#include "notify/http_client.h"

namespace notify {

// Таймауты по умолчанию: текстовый POST дешёвый, загрузка картинки дороже.
static constexpr std::chrono::milliseconds kTextTimeout{5000};
static constexpr std::chrono::milliseconds kImageTimeout{10000};

struct HttpTimeouts {
    std::chrono::milliseconds text = kTextTimeout;
    std::chrono::milliseconds image = kImageTimeout;
};

// Общая часть HTTP-каналов: имя, транспорт, таймауты и разбор ответа.
class HttpChannel : public Channel {
public:
    const std::string& name() const override { return name_; }
    void cancel() override { http_.cancel(); }

protected:
    HttpChannel(std::string name, HttpClient& http, const HttpTimeouts& timeouts);

    // Ошибка транспорта или статус >= 300 -> failed, иначе delivered.
    static ChannelOutcome outcome_from(const HttpResponse& resp);

    HttpClient& http_;
    HttpTimeouts timeouts_;

private:
    std::string name_;
};

} // namespace notify
