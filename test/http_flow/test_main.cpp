#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "notify/discord_channel.h"
#include "notify/http_client.h"
#include "notify/telegram_channel.h"
#include "notify/webhook_channel.h"

namespace {

#define CHECK(cond) \
  do { \
    if (!(cond)) { \
      std::cerr << "CHECK failed: " #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

using namespace std::chrono_literals;
using notify::DeliveryStatus;

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// HTTP-сервер на 127.0.0.1 на одно соединение за раз.
// Reply: читает запрос целиком и отвечает status/body.
// Silent: читает запрос и молчит, пока клиент не закроет сокет или сервер не остановят.
class LoopbackServer {
public:
  enum class Mode { Reply, Silent };

  explicit LoopbackServer(Mode mode, int status = 200, std::string body = "")
      : mode_(mode), status_(status), reply_body_(std::move(body)) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) return;

    int one = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd_, 4) != 0) {
      ::close(fd_);
      fd_ = -1;
      return;
    }

    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    th_ = std::thread(&LoopbackServer::run, this);
  }

  ~LoopbackServer() {
    stop_.store(true);
    if (th_.joinable()) th_.join();
    if (fd_ >= 0) ::close(fd_);
  }

  LoopbackServer(const LoopbackServer&) = delete;
  LoopbackServer& operator=(const LoopbackServer&) = delete;

  bool ok() const { return fd_ >= 0 && port_ != 0; }

  std::string url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  bool wait_request(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [this] { return requests_ > 0; });
  }

  std::string head() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return head_;
  }

  std::string body() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return body_;
  }

  int requests() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return requests_;
  }

private:
  void run() {
    while (!stop_.load()) {
      pollfd p{fd_, POLLIN, 0};
      if (::poll(&p, 1, 50) <= 0) continue;

      const int conn = ::accept(fd_, nullptr, nullptr);
      if (conn < 0) continue;
      serve(conn);
      ::close(conn);
    }
  }

  // false = соединение закрылось или сервер остановлен.
  bool read_some(int conn, std::string& data) {
    while (!stop_.load()) {
      pollfd p{conn, POLLIN, 0};
      if (::poll(&p, 1, 50) <= 0) continue;

      char buf[4096];
      const ssize_t n = ::recv(conn, buf, sizeof(buf), 0);
      if (n <= 0) return false;
      data.append(buf, static_cast<std::size_t>(n));
      return true;
    }
    return false;
  }

  static bool body_complete(const std::string& data, std::size_t head_end, const std::string& head_lc) {
    const std::size_t body_start = head_end + 4;
    if (head_lc.find("transfer-encoding: chunked") != std::string::npos) {
      return data.find("0\r\n\r\n", body_start) != std::string::npos;
    }
    const std::size_t pos = head_lc.find("content-length:");
    if (pos == std::string::npos) return true;
    const std::size_t length = std::strtoul(head_lc.c_str() + pos + 15, nullptr, 10);
    return data.size() >= body_start + length;
  }

  void serve(int conn) {
    std::string data;
    std::size_t head_end = std::string::npos;
    bool continued = false;

    for (;;) {
      if (!read_some(conn, data)) return;

      head_end = data.find("\r\n\r\n");
      if (head_end == std::string::npos) continue;

      const std::string head_lc = lower(data.substr(0, head_end));
      if (!continued && head_lc.find("expect: 100-continue") != std::string::npos) {
        send_all(conn, "HTTP/1.1 100 Continue\r\n\r\n");
        continued = true;
      }
      if (body_complete(data, head_end, head_lc)) break;
    }

    {
      std::lock_guard<std::mutex> lk(mtx_);
      head_ = data.substr(0, head_end);
      body_ = data.substr(head_end + 4);
      ++requests_;
    }
    cv_.notify_all();

    if (mode_ == Mode::Silent) {
      std::string rest;
      while (read_some(conn, rest)) {}
      return;
    }

    std::string resp = "HTTP/1.1 " + std::to_string(status_) + " Test\r\n";
    if (status_ != 204) {
      resp += "Content-Length: " + std::to_string(reply_body_.size()) + "\r\n";
    }
    resp += "Connection: close\r\n\r\n";
    if (status_ != 204) resp += reply_body_;
    send_all(conn, resp);
  }

  static void send_all(int conn, const std::string& s) {
    std::size_t off = 0;
    while (off < s.size()) {
      const ssize_t n = ::send(conn, s.data() + off, s.size() - off, MSG_NOSIGNAL);
      if (n <= 0) return;
      off += static_cast<std::size_t>(n);
    }
  }

  Mode mode_;
  int status_;
  std::string reply_body_;

  int fd_ = -1;
  unsigned short port_ = 0;
  std::thread th_;
  std::atomic<bool> stop_{false};

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::string head_;
  std::string body_;
  int requests_ = 0;
};

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// ------------------------------ request bodies ---------------------------

bool test_webhook_posts_json_body() {
  LoopbackServer server(LoopbackServer::Mode::Reply, 200, "ok");
  CHECK(server.ok());

  notify::CurlHttpClient http;
  notify::WebhookChannel ch(notify::WebhookChannel::Config{server.url("/hook")}, http);

  const auto out = ch.send("Motion detected at 2024-01-01 12:00:00", nullptr);
  CHECK(out.status == DeliveryStatus::Delivered);
  CHECK(server.wait_request(1s));

  const std::string head = server.head();
  CHECK(head.rfind("POST /hook HTTP/1.1", 0) == 0);
  CHECK(contains(lower(head), "content-type: application/json"));
  CHECK(contains(lower(head), "user-agent: smartcam/1.0"));
  CHECK(server.body() == R"({"text":"Motion detected at 2024-01-01 12:00:00"})");
  return true;
}

bool test_telegram_text_is_form_encoded() {
  LoopbackServer server(LoopbackServer::Mode::Reply, 200, R"({"ok":true})");
  CHECK(server.ok());

  notify::CurlHttpClient http;
  notify::TelegramChannel::Config cfg;
  cfg.token = "123:abc";
  cfg.chat_id = "42";
  cfg.api_base = server.url("/");
  notify::TelegramChannel ch(cfg, http);

  const auto out = ch.send("Motion at 12:00 & more", nullptr);
  CHECK(out.status == DeliveryStatus::Delivered);
  CHECK(server.wait_request(1s));

  const std::string head = server.head();
  CHECK(head.rfind("POST /bot123:abc/sendMessage HTTP/1.1", 0) == 0);
  CHECK(contains(lower(head), "content-type: application/x-www-form-urlencoded"));
  CHECK(server.body() == "chat_id=42&text=Motion%20at%2012%3A00%20%26%20more");
  return true;
}

bool test_discord_multipart_carries_image() {
  LoopbackServer server(LoopbackServer::Mode::Reply, 200, "{}");
  CHECK(server.ok());

  notify::CurlHttpClient http;
  notify::DiscordChannel::Config cfg;
  cfg.url = server.url("/api/webhooks/1/a");
  cfg.username = "Porch";
  notify::DiscordChannel ch(cfg, http);

  notify::Snapshot snap;
  snap.path = "events/event_20240101_120000.jpg";
  snap.jpeg = {0xFF, 0xD8, 0xFF, 0xE0, 'j', 'p', 'e', 'g', 0xFF, 0xD9};

  const auto out = ch.send("Motion detected", &snap);
  CHECK(out.status == DeliveryStatus::Delivered);
  CHECK(server.wait_request(1s));

  CHECK(server.head().rfind("POST /api/webhooks/1/a HTTP/1.1", 0) == 0);
  CHECK(contains(lower(server.head()), "content-type: multipart/form-data; boundary="));

  const std::string body = server.body();
  CHECK(contains(body, "name=\"content\"\r\n\r\nMotion detected\r\n"));
  CHECK(contains(body, "name=\"username\"\r\n\r\nPorch\r\n"));
  CHECK(contains(body, "name=\"file\"; filename=\"event_20240101_120000.jpg\""));
  CHECK(contains(body, "Content-Type: image/jpeg"));
  CHECK(contains(body, std::string(snap.jpeg.begin(), snap.jpeg.end())));
  return true;
}

// ------------------------------ status codes -----------------------------

bool test_error_status_fails_with_body_in_reason() {
  LoopbackServer server(LoopbackServer::Mode::Reply, 404, R"({"message": "Unknown Webhook"})");
  CHECK(server.ok());

  notify::CurlHttpClient http;
  notify::DiscordChannel ch(notify::DiscordChannel::Config{server.url("/gone"), "SmartCam"}, http);

  const auto out = ch.send("Motion detected", nullptr);
  CHECK(out.status == DeliveryStatus::Failed);
  CHECK(out.reason == R"(HTTP 404 {"message": "Unknown Webhook"})");
  return true;
}

bool test_no_content_counts_as_delivered() {
  LoopbackServer server(LoopbackServer::Mode::Reply, 204);
  CHECK(server.ok());

  notify::CurlHttpClient http;
  notify::DiscordChannel ch(notify::DiscordChannel::Config{server.url("/hook"), "SmartCam"}, http);

  const auto out = ch.send("Motion detected", nullptr);
  CHECK(out.status == DeliveryStatus::Delivered);
  CHECK(out.reason.empty());
  return true;
}

// ------------------------------ timeout / cancel -------------------------

bool test_silent_server_hits_request_timeout() {
  LoopbackServer server(LoopbackServer::Mode::Silent);
  CHECK(server.ok());

  notify::CurlHttpClient http;
  notify::HttpTimeouts timeouts;
  timeouts.text = 300ms;
  notify::WebhookChannel ch(notify::WebhookChannel::Config{server.url("/hook")}, http, timeouts);

  const auto t0 = std::chrono::steady_clock::now();
  const auto out = ch.send("Motion detected", nullptr);
  const auto elapsed = std::chrono::steady_clock::now() - t0;

  CHECK(out.status == DeliveryStatus::Failed);
  CHECK(out.reason != "cancelled");
  CHECK(!out.reason.empty());
  CHECK(elapsed < 2s);
  CHECK(server.requests() == 1);
  return true;
}

bool test_cancel_aborts_in_flight_request() {
  LoopbackServer server(LoopbackServer::Mode::Silent);
  CHECK(server.ok());

  notify::CurlHttpClient http;
  notify::HttpRequest req;
  req.url = server.url("/hook");
  req.body_json = R"({"text":"x"})";
  req.timeout = 10s;

  std::thread canceller([&] {
    server.wait_request(2s);
    std::this_thread::sleep_for(100ms);
    http.cancel();
  });

  const auto t0 = std::chrono::steady_clock::now();
  const auto resp = http.post(req);
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  canceller.join();

  CHECK(resp.error == "cancelled");
  CHECK(resp.status == 0);
  CHECK(elapsed < 3s);

  // Следующий запрос даже не соединяется.
  const auto again = http.post(req);
  CHECK(again.error == "cancelled");
  CHECK(server.requests() == 1);
  return true;
}

} // namespace

int main() {
  // Прокси из окружения не должен перехватывать 127.0.0.1.
  unsetenv("http_proxy");
  unsetenv("HTTP_PROXY");
  unsetenv("all_proxy");
  unsetenv("ALL_PROXY");

  notify::CurlGlobal curl;
  if (!curl.ok()) {
    std::cerr << "curl_global_init failed\n";
    return 1;
  }

  bool ok = true;

  ok &= test_webhook_posts_json_body();
  ok &= test_telegram_text_is_form_encoded();
  ok &= test_discord_multipart_carries_image();
  ok &= test_error_status_fails_with_body_in_reason();
  ok &= test_no_content_counts_as_delivered();
  ok &= test_silent_server_hits_request_timeout();
  ok &= test_cancel_aborts_in_flight_request();

  if (!ok) return 1;

  std::cout << "http_flow tests passed\n";
  return 0;
}
