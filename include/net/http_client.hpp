#pragma once
#include <memory>
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;
  std::string body;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  // Throws std::runtime_error when the request cannot be performed at all.
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

struct HttpClientTuning {
  bool enable_http2 = true;      // try HTTP/2 when TLS is used
  bool enable_tcp_keepalive = true;
  int tcp_keepidle_s = 30;
  int tcp_keepintvl_s = 15;
  bool verify_tls = true;
  int connect_timeout_ms = 5000;
};

// libcurl-backed client. One easy handle per client, reused across requests.
std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning = HttpClientTuning());
