/**
 * @file http_client.cpp
 * @brief libcurl backed implementation of the HTTP client interface.
 */

#include "http_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "version.hpp"
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace hgl {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = category_logger("http");
  return logger;
}

/**
 * Create a human readable error message for a CURL request.
 *
 * @param verb HTTP verb attempted.
 * @param url Request URL.
 * @param code CURL error code.
 * @param errbuf Optional buffer with extended error text.
 * @return Combined error description.
 */
std::string format_curl_error(const char *verb, const std::string &url,
                              CURLcode code, const char *errbuf) {
  std::ostringstream oss;
  oss << "curl " << verb;
  if (!url.empty()) {
    oss << ' ' << url;
  }
  oss << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

} // namespace

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

/**
 * Initialize the CURL handle, ensuring global setup occurs once.
 */
CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

/**
 * Clean up the CURL easy handle.
 */
CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, std::string http_proxy,
                               std::string https_proxy)
    : timeout_ms_(timeout_ms), http_proxy_(std::move(http_proxy)),
      https_proxy_(std::move(https_proxy)) {}

/**
 * libcurl write callback capturing response bodies into a string.
 */
static size_t write_callback(void *contents, size_t size, size_t nmemb,
                             void *userp) {
  size_t total = size * nmemb;
  std::string *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), total);
  return total;
}

/**
 * Configure proxy settings on the CURL handle based on the request URL.
 *
 * @param curl CURL handle being prepared.
 * @param url Request target URL.
 */
void CurlHttpClient::apply_proxy(CURL *curl, const std::string &url) const {
  const std::string *proxy = nullptr;
  if (url.rfind("https://", 0) == 0) {
    if (!https_proxy_.empty()) {
      proxy = &https_proxy_;
    } else if (!http_proxy_.empty()) {
      proxy = &http_proxy_;
    }
    if (proxy) {
      curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    }
  } else if (url.rfind("http://", 0) == 0) {
    if (!http_proxy_.empty()) {
      proxy = &http_proxy_;
    }
  }
  if (proxy) {
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy->c_str());
  }
}

/**
 * Issue a POST request with the provided payload.
 */
HttpResponse CurlHttpClient::post(const std::string &url,
                                  const std::string &data,
                                  const std::vector<std::string> &headers) {
  CurlHandle handle;
  CURL *curl = handle.get();
  std::string response;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  apply_proxy(curl, url);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(data.size()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  header_list.append(std::string("User-Agent: huntglitch-cpp/") + kVersion);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    std::string msg = format_curl_error("POST", url, res, errbuf);
    http_log()->debug(msg);
    throw TransientNetworkError(msg);
  }
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    http_log()->debug("curl POST {} answered HTTP {}: {}", url, http_code,
                      response);
    throw HttpStatusError(static_cast<int>(http_code),
                          "curl POST failed with HTTP code " +
                              std::to_string(http_code));
  }
  return {response, http_code};
}

} // namespace hgl
