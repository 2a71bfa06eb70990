/**
 * @file transport.hpp
 * @brief Delivery of log records to the Lighthouse ingestion endpoint.
 *
 * Serialises records, posts them through an HttpClient and applies the
 * timeout, retry and silent-failure policy of a LoggerConfig.
 */

#ifndef HUNTGLITCH_TRANSPORT_HPP
#define HUNTGLITCH_TRANSPORT_HPP

#include "config.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "log_record.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace hgl {

/// Fixed ingestion endpoint of the HuntGlitch Lighthouse API.
inline constexpr const char *kLighthouseEndpoint =
    "https://lighthouse.huntglitch.com/api/log/add";

/// Largest request body ever sent.
inline constexpr std::size_t kMaxPayloadBytes = 256 * 1024;

/// Length text fields are cut to when dropping data and tags is not enough.
inline constexpr std::size_t kMaxFieldBytes = 4 * 1024;

/**
 * Delay between attempts: @ref initial doubled per retry, capped at
 * @ref max. Never decreases from one retry to the next.
 */
struct BackoffPolicy {
  std::chrono::milliseconds initial{250};
  std::chrono::milliseconds max{2000};

  /**
   * Delay before retry number @p retry (zero based).
   */
  std::chrono::milliseconds delay_for(int retry) const;
};

/**
 * Build the JSON request body for a record.
 *
 * Contains the routing keys, every record field, the symbolic severity and
 * an ISO-8601 UTC timestamp.
 */
nlohmann::json record_to_json(const LoggerConfig &config,
                              const LogRecord &record);

/**
 * Serialise a record, enforcing kMaxPayloadBytes.
 *
 * An oversized body is reduced step by step until it fits: non-empty
 * additional data is replaced by `{"_truncated": true, "_original_bytes": N}`,
 * non-empty tags by `{"_truncated": "true"}`, then the error value, error
 * name and source file are cut to kMaxFieldBytes.
 *
 * @throws nlohmann::json::exception When the record is not serialisable
 *         (for example invalid UTF-8).
 * @throws PayloadTooLargeError When the body is still too large, e.g.
 *         because of oversized routing keys.
 */
std::string encode_payload(const LoggerConfig &config, const LogRecord &record);

/**
 * Synchronous delivery of records with bounded retry.
 *
 * Only a 2xx answer counts as delivered. Network failures and 5xx
 * responses are retried up to
 * LoggerConfig::max_retries() more times; 4xx responses are terminal.
 * Thread-safe as long as the HttpClient is.
 */
class Transport {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  /**
   * @param http HTTP client performing the requests.
   * @param endpoint Target URL. Only tests point this elsewhere.
   * @param backoff Delay policy between attempts.
   * @param sleeper Blocking wait used between attempts; defaults to
   *        std::this_thread::sleep_for.
   */
  explicit Transport(std::unique_ptr<HttpClient> http,
                     std::string endpoint = kLighthouseEndpoint,
                     BackoffPolicy backoff = {}, Sleeper sleeper = {});

  /**
   * Deliver one record.
   *
   * @return Outcome with `delivered == true` on a 2xx answer, or the failed
   *         outcome when `config.silent_failures()` is set.
   * @throws DeliveryError On failure when silent failures are disabled.
   */
  DeliveryOutcome deliver(const LoggerConfig &config,
                          const LogRecord &record) const;

  /// Target URL.
  const std::string &endpoint() const { return endpoint_; }

  /// Backoff between attempts.
  const BackoffPolicy &backoff() const { return backoff_; }

private:
  DeliveryOutcome fail(const LoggerConfig &config, const LogRecord &record,
                       DeliveryOutcome outcome) const;

  std::unique_ptr<HttpClient> http_;
  std::string endpoint_;
  BackoffPolicy backoff_;
  Sleeper sleeper_;
};

} // namespace hgl

#endif // HUNTGLITCH_TRANSPORT_HPP
