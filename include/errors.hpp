/**
 * @file errors.hpp
 * @brief Exception hierarchy used by the HuntGlitch client.
 *
 * Declares the configuration, usage and delivery errors surfaced to callers
 * as well as the typed transport errors consumed by the retry loop.
 */

#ifndef HUNTGLITCH_ERRORS_HPP
#define HUNTGLITCH_ERRORS_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace hgl {

/** Base class for every error raised by the library. */
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Required configuration is missing or invalid.
 *
 * Always thrown at construction time, regardless of the silent failure mode.
 */
class ConfigurationError : public Error {
public:
  using Error::Error;
};

/** The API was used incorrectly, e.g. capturing outside a catch handler. */
class UsageError : public Error {
public:
  using Error::Error;
};

/// Result of a delivery attempt sequence.
struct DeliveryOutcome {
  bool delivered{false};                 ///< Endpoint acknowledged the record
  int attempts_made{0};                  ///< Requests issued
  long last_status{0};                   ///< HTTP status of the last attempt
  std::optional<std::string> last_error; ///< Description of the last failure
};

/**
 * Delivery failed after retries, hit a terminal status, or the record could
 * not be serialized.
 */
class DeliveryError : public Error {
public:
  DeliveryError(const std::string &message, DeliveryOutcome outcome)
      : Error(message), outcome_(std::move(outcome)) {}

  /// Outcome describing the failed delivery.
  const DeliveryOutcome &outcome() const noexcept { return outcome_; }

private:
  DeliveryOutcome outcome_;
};

/** A record still exceeds the request size limit after truncation. */
class PayloadTooLargeError : public Error {
public:
  using Error::Error;
};

/** Network level failure (connect, DNS, timeout) worth retrying. */
class TransientNetworkError : public Error {
public:
  using Error::Error;
};

/** Non-success HTTP status returned by the endpoint. */
class HttpStatusError : public Error {
public:
  HttpStatusError(int code, const std::string &message)
      : Error(message), status(code) {}

  /// Whether the status belongs to the server error class.
  bool is_server_error() const noexcept { return status >= 500 && status < 600; }

  int status; ///< HTTP status code
};

} // namespace hgl

#endif // HUNTGLITCH_ERRORS_HPP
