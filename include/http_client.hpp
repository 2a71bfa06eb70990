/**
 * @file http_client.hpp
 * @brief HTTP transport abstraction and libcurl implementation.
 */

#ifndef HUNTGLITCH_HTTP_CLIENT_HPP
#define HUNTGLITCH_HTTP_CLIENT_HPP

#include <curl/curl.h>
#include <string>
#include <vector>

namespace hgl {

/**
 * Simple HTTP response container capturing body and status code.
 */
struct HttpResponse {
  std::string body;     ///< Response body
  long status_code = 0; ///< HTTP status code
};

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP POST request.
   *
   * @param url Absolute request URL.
   * @param data Request body payload encoded as UTF-8.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Response body and status for 2xx responses.
   * @throws TransientNetworkError When the request could not be completed.
   * @throws HttpStatusError When the endpoint answered with a non-2xx status.
   */
  virtual HttpResponse post(const std::string &url, const std::string &data,
                            const std::vector<std::string> &headers) = 0;
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;
  /**
   * Access the underlying CURL easy handle.
   *
   * @return Borrowed pointer to the CURL easy handle managed by the wrapper.
   */
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * Every request uses its own easy handle, so one instance may be shared by
 * several threads and no connection outlives the call that opened it.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * Construct a CURL based HTTP client.
   *
   * @param timeout_ms Connect and total timeout in milliseconds for each
   *        request.
   * @param http_proxy Proxy URL for HTTP requests.
   * @param https_proxy Proxy URL for HTTPS requests.
   */
  explicit CurlHttpClient(long timeout_ms = 10000, std::string http_proxy = {},
                          std::string https_proxy = {});

  /// @copydoc HttpClient::post()
  HttpResponse post(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override;

  /// Request timeout in milliseconds.
  long timeout_ms() const { return timeout_ms_; }

  /// HTTP proxy URL.
  const std::string &http_proxy() const { return http_proxy_; }

  /// HTTPS proxy URL.
  const std::string &https_proxy() const { return https_proxy_; }

private:
  void apply_proxy(CURL *curl, const std::string &url) const;
  long timeout_ms_;
  std::string http_proxy_;
  std::string https_proxy_;
};

} // namespace hgl

#endif // HUNTGLITCH_HTTP_CLIENT_HPP
