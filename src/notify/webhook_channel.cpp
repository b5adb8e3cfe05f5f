#include "notify/webhook_channel.h"

#include <nlohmann/json.hpp>

namespace notify {

WebhookChannel::WebhookChannel(const Config& cfg, HttpClient& http, const HttpTimeouts& timeouts)
        : HttpChannel("webhook", http, timeouts), cfg_(cfg) {}

ChannelOutcome WebhookChannel::send(const std::string& message, const Snapshot*) {
    if (!enabled()) {
        return ChannelOutcome::skipped("url not set");
    }

    HttpRequest req;
    req.url = cfg_.url;
    req.body = HttpRequest::Body::Json;
    req.body_json = nlohmann::json{{"text", message}}.dump();
    req.timeout = timeouts_.text;

    return outcome_from(http_.post(req));
}

} // namespace notify
