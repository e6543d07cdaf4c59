#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <memory>
#include <stdexcept>
#include <curl/curl.h>

namespace {
size_t AppendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
  return size * nmemb;
}

struct EasyDeleter { void operator()(CURL* c) const { curl_easy_cleanup(c); } };
struct SlistDeleter { void operator()(curl_slist* l) const { curl_slist_free_all(l); } };
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

// The host part only; RPC URLs often carry an API key in the path
std::string RedactUrl(const std::string& url) {
  auto scheme = url.find("://");
  auto start = scheme == std::string::npos ? 0 : scheme + 3;
  auto slash = url.find('/', start);
  return slash == std::string::npos ? url : url.substr(0, slash) + "/...";
}
}

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientTuning& tuning) : tuning_(tuning) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }
  ~CurlHttpClient() override {
    curl_global_cleanup();
  }

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    EasyHandle curl(curl_easy_init());
    if (!curl) throw std::runtime_error("curl_easy_init failed");
    HeaderList header_list;
    for (const auto& kv : headers) {
      std::string line = kv.first + ": " + kv.second;
      curl_slist* grown = curl_slist_append(header_list.get(), line.c_str());
      if (!grown) throw std::runtime_error("curl_slist_append failed");
      // append returns the existing head once the list is non-empty
      if (!header_list) header_list.reset(grown);
    }
    std::string response_body;
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, AppendBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(tuning_.connect_timeout_ms));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, tuning_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, tuning_.enable_tcp_keepalive ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPIDLE, static_cast<long>(tuning_.tcp_keepidle_s));
    curl_easy_setopt(h, CURLOPT_TCP_KEEPINTVL, static_cast<long>(tuning_.tcp_keepintvl_s));
    if (tuning_.enable_http2) curl_easy_setopt(h, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    if (!tuning_.verify_tls) {
      curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
      curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
      std::string msg = "POST " + RedactUrl(url) + " failed: " + curl_easy_strerror(rc);
      Logger::Error(msg);
      throw std::runtime_error(msg);
    }
    HttpResponse resp;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(response_body);
    return resp;
  }
private:
  HttpClientTuning tuning_;
};

HttpClient* CreateCurlHttpClient(const HttpClientTuning& tuning) {
  return new CurlHttpClient(tuning);
}
