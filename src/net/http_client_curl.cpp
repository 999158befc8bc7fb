#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <mutex>
#include <stdexcept>

namespace {
size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* s = static_cast<std::string*>(userdata);
  s->append(ptr, size * nmemb);
  return size * nmemb;
}

void EnsureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, []{
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
    }
  });
}

struct SlistDeleter {
  void operator()(curl_slist* l) const { if (l) curl_slist_free_all(l); }
};
}

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientTuning& tuning) : tuning_(tuning) {
    EnsureCurlGlobalInit();
    curl_ = curl_easy_init();
    if (!curl_) throw std::runtime_error("curl_easy_init failed");
  }
  ~CurlHttpClient() override {
    if (curl_) curl_easy_cleanup(curl_);
  }
  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    std::lock_guard<std::mutex> lock(mutex_);
    curl_easy_reset(curl_);
    std::string response_string;
    curl_slist* raw_list = nullptr;
    for (const auto& kv : headers) {
      std::string line = kv.first + ": " + kv.second;
      raw_list = curl_slist_append(raw_list, line.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_list);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(tuning_.connect_timeout_ms));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    // Keep-alive and HTTP/2
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPALIVE, tuning_.enable_tcp_keepalive ? 1L : 0L);
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPIDLE, static_cast<long>(tuning_.tcp_keepidle_s));
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPINTVL, static_cast<long>(tuning_.tcp_keepintvl_s));
    if (tuning_.enable_http2) curl_easy_setopt(curl_, CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_2TLS));
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, tuning_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, tuning_.verify_tls ? 2L : 0L);

    CURLcode rc = curl_easy_perform(curl_);
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_easy_perform failed: ") + curl_easy_strerror(rc));
    }
    HttpResponse resp;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(response_string);
    return resp;
  }

private:
  HttpClientTuning tuning_;
  CURL* curl_ = nullptr;
  std::mutex mutex_;
};

std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning) {
  Logger::Debug(std::string("Creating curl HTTP client (") + curl_version() + ")");
  return std::unique_ptr<HttpClient>(new CurlHttpClient(tuning));
}
