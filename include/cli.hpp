/**
 * @file cli.hpp
 * @brief Command line parsing for the huntglitch tool.
 *
 * Declares the option structure, the parser, and the exception used to
 * bubble exit codes (help, parse errors) back to the entry point.
 */

#ifndef HUNTGLITCH_CLI_HPP
#define HUNTGLITCH_CLI_HPP

#include "log_record.hpp"
#include <exception>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hgl {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Numeric process exit code.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options supplied via the CLI.
 */
struct CliOptions {
  std::string config_file;                ///< Optional configuration file
  std::optional<std::string> project_key; ///< Explicit project key
  std::optional<std::string> deliverable_key; ///< Explicit deliverable key
  std::optional<double> timeout_seconds;      ///< Request timeout override
  std::optional<int> max_retries;             ///< Retry count override
  bool silent{false};        ///< Report failures via exit code only
  std::string log_level{"warn"}; ///< Client log level
  std::string log_file;      ///< Optional client log file
  bool check_config{false};  ///< Only validate configuration
  std::string error_name;    ///< Event name
  std::string error_value;   ///< Event description
  std::string source_file;   ///< Source file of the event
  int source_line{0};        ///< Source line of the event
  std::string severity{"error"}; ///< Severity name or code
  std::vector<std::string> data; ///< KEY=VALUE additional data
  std::vector<std::string> tags; ///< KEY=VALUE tags
  std::string data_json;         ///< Additional data as a JSON object
};

/**
 * Parse command line arguments into CliOptions.
 *
 * @throws CliParseExit When help was requested or parsing failed; the
 *         carried exit code is the one to return from main().
 */
CliOptions parse_cli(int argc, char **argv);

/**
 * Turn `KEY=VALUE` entries into a JSON object.
 *
 * Values that parse as JSON scalars (numbers, booleans, null) keep their
 * type; everything else is stored as a string.
 *
 * @throws std::invalid_argument When an entry has no `=` or an empty key.
 */
nlohmann::json parse_key_values(const std::vector<std::string> &entries);

/**
 * Turn `KEY=VALUE` entries into string tags.
 *
 * @throws std::invalid_argument When an entry has no `=` or an empty key.
 */
Tags parse_tags(const std::vector<std::string> &entries);

} // namespace hgl

#endif // HUNTGLITCH_CLI_HPP
