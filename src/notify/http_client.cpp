#include "notify/http_client.h"

#include <curl/curl.h>

#include <memory>

namespace notify {

namespace {
    struct EasyDeleter {
        void operator()(CURL* h) const { curl_easy_cleanup(h); }
    };
    struct SlistDeleter {
        void operator()(curl_slist* l) const { curl_slist_free_all(l); }
    };
    struct MimeDeleter {
        void operator()(curl_mime* m) const { curl_mime_free(m); }
    };

    using EasyPtr = std::unique_ptr<CURL, EasyDeleter>;
    using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;
    using MimePtr = std::unique_ptr<curl_mime, MimeDeleter>;

    size_t on_write(char* ptr, size_t size, size_t nmemb, void* user) {
        auto* out = static_cast<std::string*>(user);
        out->append(ptr, size * nmemb);
        return size * nmemb;
    }

    // Ненулевой возврат заставляет curl прервать передачу с CURLE_ABORTED_BY_CALLBACK.
    int on_progress(void* user, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const auto* cancelled = static_cast<const std::atomic<bool>*>(user);
        return cancelled->load(std::memory_order_acquire) ? 1 : 0;
    }

    // key=value&key=value с экранированием через curl_easy_escape.
    std::string encode_form(CURL* easy, const std::vector<std::pair<std::string, std::string>>& fields) {
        std::string out;
        for (const auto& kv : fields) {
            char* k = curl_easy_escape(easy, kv.first.c_str(), static_cast<int>(kv.first.size()));
            char* v = curl_easy_escape(easy, kv.second.c_str(), static_cast<int>(kv.second.size()));
            if (!out.empty()) out += '&';
            if (k) out += k;
            out += '=';
            if (v) out += v;
            curl_free(k);
            curl_free(v);
        }
        return out;
    }
}

// ----------------------------- CurlGlobal -----------------------------

CurlGlobal::CurlGlobal() {
    ok_ = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
}

CurlGlobal::~CurlGlobal() {
    if (ok_) {
        curl_global_cleanup();
    }
}

// ---------------------------- CurlHttpClient --------------------------

CurlHttpClient::CurlHttpClient() : CurlHttpClient(Config{}) {}

CurlHttpClient::CurlHttpClient(const Config& cfg) : cfg_(cfg) {}

void CurlHttpClient::cancel() {
    cancelled_.store(true, std::memory_order_release);
}

HttpResponse CurlHttpClient::post(const HttpRequest& req) {
    HttpResponse resp;

    if (cancelled_.load(std::memory_order_acquire)) {
        resp.error = "cancelled";
        return resp;
    }

    EasyPtr easy(curl_easy_init());
    if (!easy) {
        resp.error = "curl_easy_init failed";
        return resp;
    }
    CURL* h = easy.get();

    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);   // таймауты без SIGALRM, мы в рабочих потоках
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout.count()));
    curl_easy_setopt(h, CURLOPT_USERAGENT, cfg_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_VERBOSE, cfg_.verbose ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &on_write);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, &on_progress);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &cancelled_);

    SlistPtr headers;
    MimePtr mime;
    std::string form_body;

    switch (req.body) {
        case HttpRequest::Body::Json: {
            headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body_json.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body_json.size()));
            break;
        }
        case HttpRequest::Body::Form: {
            form_body = encode_form(h, req.fields);
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, form_body.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(form_body.size()));
            break;
        }
        case HttpRequest::Body::Multipart: {
            mime.reset(curl_mime_init(h));
            if (!mime) {
                resp.error = "curl_mime_init failed";
                return resp;
            }
            for (const auto& kv : req.fields) {
                curl_mimepart* part = curl_mime_addpart(mime.get());
                curl_mime_name(part, kv.first.c_str());
                curl_mime_data(part, kv.second.data(), kv.second.size());
            }
            if (req.has_file && req.file.data) {
                curl_mimepart* part = curl_mime_addpart(mime.get());
                curl_mime_name(part, req.file.field.c_str());
                curl_mime_filename(part, req.file.filename.c_str());
                curl_mime_type(part, req.file.content_type.c_str());
                curl_mime_data(part,
                               reinterpret_cast<const char*>(req.file.data->data()),
                               req.file.data->size());
            }
            curl_easy_setopt(h, CURLOPT_MIMEPOST, mime.get());
            break;
        }
    }

    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        resp.error = (rc == CURLE_ABORTED_BY_CALLBACK) ? "cancelled" : curl_easy_strerror(rc);
        return resp;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

} // namespace notify
