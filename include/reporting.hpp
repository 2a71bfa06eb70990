/**
 * @file reporting.hpp
 * @brief Helpers that report exceptions escaping a callable or a scope.
 *
 * with_error_reporting() wraps a callable so that any exception it throws is
 * reported and then rethrown unchanged. ErrorReportingScope reports when the
 * enclosing scope is left by an exception.
 */

#ifndef HUNTGLITCH_REPORTING_HPP
#define HUNTGLITCH_REPORTING_HPP

#include "errors.hpp"
#include "log_record.hpp"
#include "logger.hpp"
#include <exception>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <utility>

namespace hgl {

/**
 * Report @p error through @p logger without ever throwing.
 *
 * Failures (including DeliveryError) are logged and dropped so that the
 * exception being propagated is never replaced.
 *
 * @return Whether the record was delivered.
 */
bool report_quietly(const Logger &logger, std::exception_ptr error,
                    nlohmann::json additional_data, Tags tags,
                    const SourceLocation &location) noexcept;

namespace detail {

template <typename F> struct is_std_function : std::false_type {};
template <typename R, typename... Args>
struct is_std_function<std::function<R(Args...)>> : std::true_type {};

template <typename F> bool is_empty_callable(const F &f) {
  if constexpr (std::is_pointer_v<F> || is_std_function<F>::value) {
    return !f;
  } else {
    (void)f;
    return false;
  }
}

} // namespace detail

/**
 * Wrap @p f so that exceptions escaping it are reported and rethrown.
 *
 * The report carries `function_name` plus every member of @p context in its
 * additional data. @p logger must outlive the returned callable.
 *
 * @throws UsageError When @p f is an empty std::function or null pointer.
 */
template <typename F>
auto with_error_reporting(const Logger &logger, std::string function_name,
                          F f, nlohmann::json context = nlohmann::json::object(),
                          Tags tags = {}) {
  if (detail::is_empty_callable(f)) {
    throw UsageError("with_error_reporting requires a callable");
  }
  if (!context.is_object()) {
    context = nlohmann::json{{"context", std::move(context)}};
  }
  context["function_name"] = std::move(function_name);
  return [&logger, f = std::move(f), context = std::move(context),
          tags = std::move(tags)](auto &&...args) mutable -> decltype(auto) {
    try {
      return std::invoke(f, std::forward<decltype(args)>(args)...);
    } catch (...) {
      report_quietly(logger, std::current_exception(), context, tags, {});
      throw;
    }
  };
}

/**
 * RAII guard reporting a scope that is left by an exception.
 *
 * On exceptional exit the destructor sends a `ScopeFailure` record naming
 * the operation; the exception object itself is not reachable from a
 * destructor. Use run() to report the actual exception type and message.
 *
 * @code
 * hgl::ErrorReportingScope scope(logger, "database_operation",
 *                                {{"table", "users"}}, HGL_HERE);
 * scope.run([&] { insert_user(); });
 * @endcode
 */
class ErrorReportingScope {
public:
  ErrorReportingScope(const Logger &logger, std::string operation,
                      nlohmann::json context = nlohmann::json::object(),
                      SourceLocation location = {});
  ~ErrorReportingScope();

  ErrorReportingScope(const ErrorReportingScope &) = delete;
  ErrorReportingScope &operator=(const ErrorReportingScope &) = delete;

  /**
   * Invoke @p f; an escaping exception is reported and rethrown.
   */
  template <typename F> decltype(auto) run(F &&f) {
    try {
      return std::invoke(std::forward<F>(f));
    } catch (...) {
      reported_ = true;
      report_quietly(logger_, std::current_exception(), scope_data(), {},
                     location_);
      throw;
    }
  }

  /// Whether a report was already sent for this scope.
  bool reported() const { return reported_; }

  /// Operation name given at construction.
  const std::string &operation() const { return operation_; }

private:
  nlohmann::json scope_data() const;

  const Logger &logger_;
  std::string operation_;
  nlohmann::json context_;
  SourceLocation location_;
  int uncaught_on_entry_;
  bool reported_{false};
};

} // namespace hgl

#endif // HUNTGLITCH_REPORTING_HPP
