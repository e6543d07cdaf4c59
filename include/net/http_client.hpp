#pragma once
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;
  std::string body;
};

// JSON-RPC nodes and the bridge are both reached through this seam.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  // Transport failures throw std::runtime_error; HTTP error statuses are returned
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

struct HttpClientTuning {
  bool enable_http2 = true;      // negotiated over TLS only
  bool enable_tcp_keepalive = true;
  int tcp_keepidle_s = 30;
  int tcp_keepintvl_s = 15;
  bool verify_tls = true;
  int connect_timeout_ms = 5000;
  std::string user_agent = "tokenops/0.1";
};

// libcurl-based client; caller owns the result
HttpClient* CreateCurlHttpClient(const HttpClientTuning& tuning = HttpClientTuning());
