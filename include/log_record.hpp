/**
 * @file log_record.hpp
 * @brief Normalised records describing an error or message to report.
 *
 * Declares severities, source locations, the LogRecord value type and the
 * builders that turn explicit events or captured exceptions into records.
 */

#ifndef HUNTGLITCH_LOG_RECORD_HPP
#define HUNTGLITCH_LOG_RECORD_HPP

#include <exception>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <typeinfo>
#include <utility>

namespace hgl {

/// Closed set of record severities.
enum class Severity {
  Info = 1,    ///< Informational event
  Warning = 2, ///< Something unexpected but handled
  Error = 3,   ///< Operation failed
  Critical = 4 ///< Application level failure
};

/// Severity used whenever an input cannot be interpreted.
inline constexpr Severity kFallbackSeverity = Severity::Error;

/**
 * Interpret a severity name.
 *
 * Names are case-insensitive. `warn` is accepted for `warning`, `fatal` for
 * `critical` and `debug` for `info`. A decimal string is treated as a
 * numeric code. Anything else yields kFallbackSeverity.
 */
Severity parse_severity(const std::string &name);

/**
 * Interpret a numeric severity code: 1 info, 2 warning, 3 error,
 * 4 critical. Other codes yield kFallbackSeverity.
 */
Severity severity_from_code(long long code);

/// Symbolic wire name of a severity.
const char *to_string(Severity severity);

/**
 * Severity argument accepting an enum value, a name or a numeric code.
 *
 * Conversion never fails; see parse_severity() and severity_from_code().
 */
class SeverityValue {
public:
  SeverityValue(Severity severity) : severity_(severity) {}
  SeverityValue(const char *name)
      : severity_(name != nullptr ? parse_severity(name) : kFallbackSeverity) {}
  SeverityValue(const std::string &name) : severity_(parse_severity(name)) {}
  SeverityValue(int code) : severity_(severity_from_code(code)) {}

  Severity get() const { return severity_; }

private:
  Severity severity_;
};

/// File and line an event originates from.
struct SourceLocation {
  std::string file; ///< Source file path, empty when unknown
  int line{0};      ///< One-based line number, 0 when unknown
};

/// Location of the expansion site.
#define HGL_HERE (::hgl::SourceLocation{__FILE__, __LINE__})

/**
 * Mixin carrying the location an exception was thrown from.
 *
 * Prefer HGL_THROW over using this class directly.
 */
class LocatedError {
public:
  virtual ~LocatedError() = default;

  /// Throw site.
  const SourceLocation &location() const noexcept { return location_; }

  /// Type that was requested at the throw site.
  virtual const std::type_info &thrown_type() const noexcept = 0;

protected:
  explicit LocatedError(SourceLocation location)
      : location_(std::move(location)) {}

private:
  SourceLocation location_;
};

/**
 * Exception of type @p E that also records where it was thrown.
 *
 * Catch handlers for @p E keep working unchanged.
 */
template <typename E> class Located : public E, public LocatedError {
public:
  template <typename... Args>
  explicit Located(SourceLocation location, Args &&...args)
      : E(std::forward<Args>(args)...), LocatedError(std::move(location)) {}

  const std::type_info &thrown_type() const noexcept override {
    return typeid(E);
  }
};

/// Throw `Type(args...)` tagged with the current file and line.
#define HGL_THROW(Type, ...)                                                   \
  throw ::hgl::Located<Type>(HGL_HERE, __VA_ARGS__)

/// String tags attached to a record.
using Tags = std::map<std::string, std::string>;

/// Immutable description of one event to report.
class LogRecord {
public:
  LogRecord(std::string error_name, std::string error_value,
            std::string source_file, int source_line, Severity severity,
            nlohmann::json additional_data, Tags tags)
      : error_name_(std::move(error_name)),
        error_value_(std::move(error_value)),
        source_file_(std::move(source_file)), source_line_(source_line),
        severity_(severity), additional_data_(std::move(additional_data)),
        tags_(std::move(tags)) {}

  const std::string &error_name() const { return error_name_; }
  const std::string &error_value() const { return error_value_; }
  const std::string &source_file() const { return source_file_; }
  int source_line() const { return source_line_; }
  Severity severity() const { return severity_; }
  const nlohmann::json &additional_data() const { return additional_data_; }
  const Tags &tags() const { return tags_; }

private:
  std::string error_name_;
  std::string error_value_;
  std::string source_file_;
  int source_line_;
  Severity severity_;
  nlohmann::json additional_data_;
  Tags tags_;
};

/**
 * Build a record for an explicit event.
 *
 * Negative line numbers are clamped to zero. A null @p additional_data
 * becomes an empty object and a non-object value is wrapped as
 * `{"value": ...}`.
 */
LogRecord build_record(std::string error_name, std::string error_value,
                       std::string source_file, int source_line,
                       SeverityValue severity,
                       nlohmann::json additional_data = nlohmann::json::object(),
                       Tags tags = {});

/**
 * Build a record describing a captured exception.
 *
 * The error name is the demangled type of the exception and the value its
 * `what()` text. The source location is the throw site of the deepest
 * exception in a `std::throw_with_nested` chain that was thrown with
 * HGL_THROW; when none carries a location @p fallback is used. Nested
 * chains are also listed under `additional_data["exception_chain"]`,
 * outermost first. The severity is always error.
 *
 * @param error Exception to describe, usually `std::current_exception()`.
 * @param fallback Location used when the exception carries none.
 * @throws UsageError When @p error is null.
 */
LogRecord build_record_from_exception(
    std::exception_ptr error, SourceLocation fallback,
    nlohmann::json additional_data = nlohmann::json::object(), Tags tags = {});

/// Readable name of a type, demangled where the ABI allows.
std::string demangle(const std::type_info &type);

} // namespace hgl

#endif // HUNTGLITCH_LOG_RECORD_HPP
