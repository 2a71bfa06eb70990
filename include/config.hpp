#ifndef HUNTGLITCH_CONFIG_HPP
#define HUNTGLITCH_CONFIG_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hgl {

/// Source name of the required project identifier.
inline constexpr const char *kProjectKeyName = "PROJECT_KEY";
/// Source name of the required deliverable identifier.
inline constexpr const char *kDeliverableKeyName = "DELIVERABLE_KEY";
/// Source name of the request timeout in seconds.
inline constexpr const char *kTimeoutName = "HUNTGLITCH_TIMEOUT";
/// Source name of the retry count.
inline constexpr const char *kRetriesName = "HUNTGLITCH_RETRIES";
/// Source name of the silent failure flag.
inline constexpr const char *kSilentFailuresName = "HUNTGLITCH_SILENT_FAILURES";

/**
 * Explicit overrides supplied by the caller when constructing a logger.
 *
 * Unset members fall back to the configuration source, then to defaults.
 */
struct LoggerOptions {
  std::optional<std::string> project_key;
  std::optional<std::string> deliverable_key;
  std::optional<double> timeout_seconds;
  std::optional<int> max_retries;
  std::optional<bool> silent_failures;
};

/// Resolved, immutable client configuration.
class LoggerConfig {
public:
  static constexpr double kDefaultTimeoutSeconds = 10.0;
  static constexpr int kDefaultMaxRetries = 3;
  static constexpr bool kDefaultSilentFailures = false;

  /**
   * Validate and build a configuration.
   *
   * @throws ConfigurationError When a key is empty, the timeout is not
   *         positive or the retry count is negative.
   */
  static LoggerConfig create(std::string project_key,
                             std::string deliverable_key,
                             double timeout_seconds = kDefaultTimeoutSeconds,
                             int max_retries = kDefaultMaxRetries,
                             bool silent_failures = kDefaultSilentFailures);

  /// Project identifier sent with every record.
  const std::string &project_key() const { return project_key_; }

  /// Deliverable identifier sent with every record.
  const std::string &deliverable_key() const { return deliverable_key_; }

  /// Per-request timeout in seconds.
  double timeout_seconds() const { return timeout_seconds_; }

  /// Per-request timeout as a duration.
  std::chrono::milliseconds timeout() const;

  /// Additional attempts after the first one for transient failures.
  int max_retries() const { return max_retries_; }

  /// Report failures as `false` instead of throwing DeliveryError.
  bool silent_failures() const { return silent_failures_; }

private:
  LoggerConfig(std::string project_key, std::string deliverable_key,
               double timeout_seconds, int max_retries, bool silent_failures);

  std::string project_key_;
  std::string deliverable_key_;
  double timeout_seconds_;
  int max_retries_;
  bool silent_failures_;
};

/** Named key/value lookup the resolver reads ambient settings from. */
class ConfigSource {
public:
  virtual ~ConfigSource() = default;

  /**
   * Look up a setting.
   *
   * @param name One of the `k*Name` constants.
   * @return Raw string value, or empty when the source has no entry.
   */
  virtual std::optional<std::string> lookup(const std::string &name) const = 0;

  /// Short description used in diagnostics.
  virtual std::string describe() const = 0;
};

/// Reads settings from the process environment.
class EnvConfigSource : public ConfigSource {
public:
  std::optional<std::string> lookup(const std::string &name) const override;
  std::string describe() const override { return "environment"; }
};

/// In-memory settings.
class MapConfigSource : public ConfigSource {
public:
  MapConfigSource() = default;
  explicit MapConfigSource(std::unordered_map<std::string, std::string> values)
      : values_(std::move(values)) {}

  std::optional<std::string> lookup(const std::string &name) const override;
  std::string describe() const override { return "map"; }

  /// Set or replace a value.
  void set(const std::string &name, const std::string &value) {
    values_[name] = value;
  }

private:
  std::unordered_map<std::string, std::string> values_;
};

/**
 * Settings loaded from a JSON, YAML, or TOML file.
 *
 * Recognised keys are `project_key`, `deliverable_key`, `timeout`
 * (`timeout_seconds`), `retries` (`max_retries`) and `silent_failures`,
 * either at the top level or inside a `huntglitch`, `credentials` or
 * `network` section.
 */
class FileConfigSource : public ConfigSource {
public:
  /**
   * Load settings from disk.
   *
   * @param path Configuration file; the format is chosen by extension.
   * @throws ConfigurationError When the file cannot be read or parsed.
   */
  static FileConfigSource from_file(const std::string &path);

  std::optional<std::string> lookup(const std::string &name) const override;
  std::string describe() const override { return path_; }

private:
  FileConfigSource(std::string path,
                   std::unordered_map<std::string, std::string> values)
      : path_(std::move(path)), values_(std::move(values)) {}

  std::string path_;
  std::unordered_map<std::string, std::string> values_;
};

/// Queries several sources in order; the first hit wins.
class ChainedConfigSource : public ConfigSource {
public:
  explicit ChainedConfigSource(
      std::vector<std::shared_ptr<const ConfigSource>> sources)
      : sources_(std::move(sources)) {}

  std::optional<std::string> lookup(const std::string &name) const override;
  std::string describe() const override;

private:
  std::vector<std::shared_ptr<const ConfigSource>> sources_;
};

/**
 * Combine explicit overrides, an injected source and defaults into a
 * LoggerConfig.
 */
class ConfigResolver {
public:
  /**
   * @param source Ambient settings. Defaults to the process environment.
   */
  explicit ConfigResolver(std::shared_ptr<const ConfigSource> source =
                              std::make_shared<EnvConfigSource>());

  /**
   * Resolve a configuration.
   *
   * Precedence is explicit override, then source value, then default.
   *
   * @throws ConfigurationError Naming the missing key(s) or the value that
   *         failed to parse.
   */
  LoggerConfig resolve(const LoggerOptions &overrides = {}) const;

  /// Source used for ambient lookups.
  const ConfigSource &source() const { return *source_; }

private:
  std::shared_ptr<const ConfigSource> source_;
};

/**
 * Parse a boolean setting.
 *
 * Accepts `1/0`, `true/false`, `yes/no` and `on/off` in any case.
 */
std::optional<bool> parse_bool(const std::string &value);

} // namespace hgl

#endif // HUNTGLITCH_CONFIG_HPP
