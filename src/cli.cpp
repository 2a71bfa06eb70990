#include "cli.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hgl {

namespace {

std::pair<std::string, std::string> split_key_value(const std::string &entry) {
  auto pos = entry.find('=');
  if (pos == std::string::npos || pos == 0) {
    throw std::invalid_argument("Expected KEY=VALUE, got '" + entry + "'");
  }
  return {entry.substr(0, pos), entry.substr(pos + 1)};
}

} // namespace

nlohmann::json parse_key_values(const std::vector<std::string> &entries) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto &entry : entries) {
    auto [key, value] = split_key_value(entry);
    nlohmann::json parsed = nlohmann::json::parse(value, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_primitive() && !parsed.is_string()) {
      out[key] = std::move(parsed);
    } else {
      out[key] = value;
    }
  }
  return out;
}

Tags parse_tags(const std::vector<std::string> &entries) {
  Tags tags;
  for (const auto &entry : entries) {
    auto [key, value] = split_key_value(entry);
    tags[key] = value;
  }
  return tags;
}

/**
 * Parse command line arguments using CLI11.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Fully populated CLI options.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"Send an event to the HuntGlitch Lighthouse API"};
  app.set_version_flag("--version", std::string("huntglitch ") + kVersion);
  CliOptions options;

  app.add_option("-C,--config", options.config_file,
                 "Configuration file (JSON, YAML or TOML)")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("Configuration");
  app.add_option_function<std::string>(
         "--project-key",
         [&options](const std::string &value) { options.project_key = value; },
         "Project key (defaults to PROJECT_KEY)")
      ->type_name("KEY")
      ->group("Configuration");
  app.add_option_function<std::string>(
         "--deliverable-key",
         [&options](const std::string &value) {
           options.deliverable_key = value;
         },
         "Deliverable key (defaults to DELIVERABLE_KEY)")
      ->type_name("KEY")
      ->group("Configuration");
  app.add_option_function<double>(
         "--timeout",
         [&options](const double &value) { options.timeout_seconds = value; },
         "Request timeout in seconds")
      ->type_name("SECONDS")
      ->check(CLI::PositiveNumber)
      ->group("Configuration");
  app.add_option_function<int>(
         "--retries",
         [&options](const int &value) { options.max_retries = value; },
         "Retries after a transient failure")
      ->type_name("N")
      ->check(CLI::NonNegativeNumber)
      ->group("Configuration");
  app.add_flag("--silent", options.silent,
               "Report delivery failures through the exit code only")
      ->group("Configuration");
  app.add_flag("--check-config", options.check_config,
               "Validate configuration and exit without sending")
      ->group("Configuration");
  app.add_option("--log-level", options.log_level, "Client log level")
      ->type_name("LEVEL")
      ->default_val("warn")
      ->check(CLI::IsMember(
          {"trace", "debug", "info", "warn", "error", "critical", "off"}))
      ->group("Logging");
  app.add_option("--log-file", options.log_file, "Write client logs to FILE")
      ->type_name("FILE")
      ->group("Logging");

  auto *name_opt = app.add_option("-n,--name", options.error_name,
                                  "Event or error name")
                       ->type_name("NAME")
                       ->group("Event");
  app.add_option("-m,--value", options.error_value, "Event description")
      ->type_name("TEXT")
      ->group("Event");
  app.add_option("-f,--file", options.source_file, "Source file")
      ->type_name("FILE")
      ->group("Event");
  app.add_option("-l,--line", options.source_line, "Source line")
      ->type_name("N")
      ->check(CLI::NonNegativeNumber)
      ->group("Event");
  app.add_option("-s,--severity", options.severity,
                 "info, warning, error, critical or 1-4")
      ->type_name("SEVERITY")
      ->default_val("error")
      ->group("Event");
  app.add_option("-d,--data", options.data, "Additional data entry")
      ->type_name("KEY=VALUE")
      ->group("Event");
  app.add_option("-t,--tag", options.tags, "Tag entry")
      ->type_name("KEY=VALUE")
      ->group("Event");
  app.add_option("--data-json", options.data_json,
                 "Additional data as a JSON object")
      ->type_name("JSON")
      ->group("Event");

  try {
    app.parse(argc, argv);
    if (!options.check_config && name_opt->count() == 0U) {
      throw CLI::RequiredError("--name");
    }
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  return options;
}

} // namespace hgl
