/**
 * @file logger.hpp
 * @brief Public logger object reporting events and exceptions to HuntGlitch.
 */

#ifndef HUNTGLITCH_LOGGER_HPP
#define HUNTGLITCH_LOGGER_HPP

#include "config.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "log_record.hpp"
#include "transport.hpp"
#include <exception>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace hgl {

/**
 * Configured client for the HuntGlitch Lighthouse API.
 *
 * Configuration is resolved once at construction; a missing project or
 * deliverable key fails immediately with ConfigurationError. Every
 * reporting call is synchronous. When silent failures are enabled the
 * reporting calls return `false` on failure; otherwise they throw
 * DeliveryError (or UsageError for misuse).
 *
 * A Logger may be shared between threads.
 */
class Logger {
public:
  /**
   * Resolve configuration from @p options and @p source.
   *
   * @param options Explicit overrides; unset members come from @p source.
   * @param source Ambient settings, the process environment by default.
   * @param http HTTP client to use; a CurlHttpClient honouring the
   *        configured timeout is created when null.
   * @throws ConfigurationError When required settings are missing.
   */
  explicit Logger(const LoggerOptions &options = {},
                  std::shared_ptr<const ConfigSource> source =
                      std::make_shared<EnvConfigSource>(),
                  std::unique_ptr<HttpClient> http = nullptr);

  /**
   * Use an already resolved configuration and a prepared transport.
   */
  Logger(LoggerConfig config, std::unique_ptr<Transport> transport);

  /**
   * Send an explicit event.
   *
   * @param error_name Short event or error identifier.
   * @param error_value Human readable description.
   * @param file_name Source file the event relates to.
   * @param line_number Line in @p file_name.
   * @param log_type Severity as enum, name (`"warning"`) or code (`2`).
   * @param additional_data Arbitrary JSON object sent along.
   * @param tags String tags.
   * @return Whether the endpoint accepted the record.
   * @throws DeliveryError On failure unless silent failures are enabled.
   */
  bool send_log(std::string error_name, std::string error_value,
                std::string file_name, int line_number,
                SeverityValue log_type = Severity::Error,
                nlohmann::json additional_data = nlohmann::json::object(),
                Tags tags = {}) const;

  /**
   * Report the exception currently being handled.
   *
   * Must be called from inside a catch handler (directly or indirectly).
   *
   * @param location Fallback source location, see HGL_CAPTURE_EXCEPTION.
   * @return Whether the endpoint accepted the record.
   * @throws UsageError When no exception is being handled and silent
   *         failures are disabled. No request is made in that case.
   * @throws DeliveryError On failure unless silent failures are enabled.
   */
  bool capture_exception(nlohmann::json additional_data = nlohmann::json::object(),
                         Tags tags = {}, SourceLocation location = {}) const;

  /**
   * Report a specific exception, e.g. one carried across threads.
   *
   * Same contract as capture_exception().
   */
  bool report_exception(std::exception_ptr error,
                        nlohmann::json additional_data = nlohmann::json::object(),
                        Tags tags = {}, SourceLocation location = {}) const;

  /**
   * Deliver a prepared record and return the full outcome.
   *
   * @throws DeliveryError On failure unless silent failures are enabled.
   */
  DeliveryOutcome deliver(const LogRecord &record) const;

  /// Resolved configuration.
  const LoggerConfig &config() const { return config_; }

private:
  LoggerConfig config_;
  std::unique_ptr<Transport> transport_;
};

/// Report the handled exception with the call site as fallback location.
#define HGL_CAPTURE_EXCEPTION(logger)                                          \
  (logger).capture_exception(nlohmann::json::object(), ::hgl::Tags{}, HGL_HERE)

/// As HGL_CAPTURE_EXCEPTION, with additional data and tags.
#define HGL_CAPTURE_EXCEPTION_WITH(logger, data, tags)                         \
  (logger).capture_exception((data), (tags), HGL_HERE)

} // namespace hgl

#endif // HUNTGLITCH_LOGGER_HPP
