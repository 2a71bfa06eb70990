/**
 * @file huntglitch.hpp
 * @brief Umbrella header and one-call reporting helpers.
 *
 * The free functions resolve their configuration from the process
 * environment (`PROJECT_KEY`, `DELIVERABLE_KEY` and the optional
 * `HUNTGLITCH_*` settings) on every call and never throw: any failure is
 * logged and reported as `false`.
 */

#ifndef HUNTGLITCH_HUNTGLITCH_HPP
#define HUNTGLITCH_HUNTGLITCH_HPP

#include "config.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "log_record.hpp"
#include "logger.hpp"
#include "reporting.hpp"
#include "transport.hpp"
#include "version.hpp"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace hgl {

/// Creates the HTTP client used by the free functions.
using HttpClientFactory =
    std::function<std::unique_ptr<HttpClient>(const LoggerConfig &)>;

/**
 * Replace the HTTP client factory used by send_huntglitch_log() and
 * capture_exception_and_report(). An empty factory restores the default
 * CurlHttpClient.
 */
void set_http_client_factory(HttpClientFactory factory);

/**
 * Send an explicit event using environment configuration.
 *
 * @return `true` when delivered; `false` on any configuration or delivery
 *         failure.
 */
bool send_huntglitch_log(std::string error_name, std::string error_value,
                         std::string file_name, int line_number,
                         SeverityValue log_type = Severity::Error,
                         nlohmann::json additional_data = nlohmann::json::object(),
                         Tags tags = {}) noexcept;

/**
 * Report the exception currently being handled using environment
 * configuration.
 *
 * Called outside a catch handler it makes no request and returns `false`;
 * the diagnostic is logged as a warning when silent failures are enabled
 * and as an error otherwise.
 *
 * @return `true` when delivered.
 */
bool capture_exception_and_report(
    nlohmann::json additional_data = nlohmann::json::object(), Tags tags = {},
    SourceLocation location = {}) noexcept;

/// capture_exception_and_report() with the call site as fallback location.
#define HGL_REPORT_CURRENT_EXCEPTION()                                         \
  ::hgl::capture_exception_and_report(nlohmann::json::object(), ::hgl::Tags{}, \
                                      HGL_HERE)

} // namespace hgl

#endif // HUNTGLITCH_HUNTGLITCH_HPP
