#include "notify/discord_channel.h"

#include <nlohmann/json.hpp>

namespace notify {

DiscordChannel::DiscordChannel(const Config& cfg, HttpClient& http, const HttpTimeouts& timeouts)
        : HttpChannel("discord", http, timeouts), cfg_(cfg) {}

ChannelOutcome DiscordChannel::send(const std::string& message, const Snapshot* snapshot) {
    if (!enabled()) {
        return ChannelOutcome::skipped("url not set");
    }

    HttpRequest req;
    req.url = cfg_.url;
    if (snapshot && snapshot->has_image()) {
        req.body = HttpRequest::Body::Multipart;
        req.fields = {{"content", message}, {"username", cfg_.username}};
        req.file.field = "file";
        req.file.filename = snapshot->filename();
        req.file.content_type = "image/jpeg";
        req.file.data = &snapshot->jpeg;
        req.has_file = true;
        req.timeout = timeouts_.image;
    } else {
        req.body = HttpRequest::Body::Json;
        req.body_json = nlohmann::json{{"content", message}, {"username", cfg_.username}}.dump();
        req.timeout = timeouts_.text;
    }

    return outcome_from(http_.post(req));
}

} // namespace notify
