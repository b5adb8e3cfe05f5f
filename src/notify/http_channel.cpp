#include "notify/http_channel.h"

#include <utility>

namespace notify {

namespace {
    // Сколько символов тела ответа попадает в причину ошибки.
    constexpr std::size_t kMaxBodyInReason = 200;
}

HttpChannel::HttpChannel(std::string name, HttpClient& http, const HttpTimeouts& timeouts)
        : http_(http), timeouts_(timeouts), name_(std::move(name)) {}

ChannelOutcome HttpChannel::outcome_from(const HttpResponse& resp) {
    if (!resp.transport_ok()) {
        return ChannelOutcome::failed(resp.error);
    }
    if (resp.status >= 300 || resp.status < 100) {
        std::string why = "HTTP " + std::to_string(resp.status);
        if (!resp.body.empty()) {
            why += " ";
            why += resp.body.substr(0, kMaxBodyInReason);
        }
        return ChannelOutcome::failed(why);
    }
    return ChannelOutcome::delivered();
}

} // namespace notify
