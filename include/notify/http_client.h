#pragma once
#include <atomic>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace notify {

// Файл, прикладываемый к multipart-запросу. data не владеет буфером:
// он должен жить до конца post().
struct HttpFilePart {
    std::string field;
    std::string filename;
    std::string content_type = "application/octet-stream";
    const std::vector<unsigned char>* data = nullptr;
};

struct HttpRequest {
    enum class Body {
        Json,       // body_json как application/json
        Form,       // fields как application/x-www-form-urlencoded
        Multipart   // fields + file как multipart/form-data
    };

    std::string url;
    Body body = Body::Json;
    std::string body_json;
    std::vector<std::pair<std::string, std::string>> fields;
    HttpFilePart file;
    bool has_file = false;
    std::chrono::milliseconds timeout{5000};
};

struct HttpResponse {
    long status = 0;     // HTTP код, 0 если ответа не было
    std::string body;
    std::string error;   // пусто, если транспорт отработал

    bool transport_ok() const { return error.empty(); }
};

// Транспорт для каналов уведомлений. post() не бросает исключений:
// любые ошибки сети возвращаются в HttpResponse::error.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post(const HttpRequest& req) = 0;

    // Прерывает текущие и все последующие запросы (используется при выходе).
    virtual void cancel() {}
};

// RAII-обёртка над curl_global_init/curl_global_cleanup. Создаётся один раз в main
// до запуска любых потоков.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const { return ok_; }

private:
    bool ok_ = false;
};

// Реализация на libcurl: новый easy handle на каждый запрос, поэтому
// один экземпляр можно безопасно звать из нескольких потоков.
class CurlHttpClient : public HttpClient {
public:
    struct Config {
        std::string user_agent = "smartcam/1.0";
        bool verbose = false;   // CURLOPT_VERBOSE
    };

    CurlHttpClient();
    explicit CurlHttpClient(const Config& cfg);

    HttpResponse post(const HttpRequest& req) override;
    void cancel() override;

private:
    Config cfg_;
    std::atomic<bool> cancelled_{false};
};

} // namespace notify
