#include "notify/telegram_channel.h"

namespace notify {

TelegramChannel::TelegramChannel(const Config& cfg, HttpClient& http, const HttpTimeouts& timeouts)
        : HttpChannel("telegram", http, timeouts), cfg_(cfg) {
    while (!cfg_.api_base.empty() && cfg_.api_base.back() == '/') {
        cfg_.api_base.pop_back();
    }
}

std::string TelegramChannel::method_url(const char* method) const {
    return cfg_.api_base + "/bot" + cfg_.token + "/" + method;
}

ChannelOutcome TelegramChannel::send(const std::string& message, const Snapshot* snapshot) {
    if (!enabled()) {
        return ChannelOutcome::skipped("token or chat_id not set");
    }

    HttpRequest req;
    if (snapshot && snapshot->has_image()) {
        req.url = method_url("sendPhoto");
        req.body = HttpRequest::Body::Multipart;
        req.fields = {{"chat_id", cfg_.chat_id}, {"caption", message}};
        req.file.field = "photo";
        req.file.filename = snapshot->filename();
        req.file.content_type = "image/jpeg";
        req.file.data = &snapshot->jpeg;
        req.has_file = true;
        req.timeout = timeouts_.image;
    } else {
        req.url = method_url("sendMessage");
        req.body = HttpRequest::Body::Form;
        req.fields = {{"chat_id", cfg_.chat_id}, {"text", message}};
        req.timeout = timeouts_.text;
    }

    return outcome_from(http_.post(req));
}

} // namespace notify
