/**
 * @file app.cpp
 * @brief Implementation of the huntglitch command line flow.
 */

#include "app.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "logger.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace hgl {

namespace {

std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = category_logger("app");
  return logger;
}

LoggerOptions to_logger_options(const CliOptions &opts) {
  LoggerOptions out;
  out.project_key = opts.project_key;
  out.deliverable_key = opts.deliverable_key;
  out.timeout_seconds = opts.timeout_seconds;
  out.max_retries = opts.max_retries;
  if (opts.silent) {
    out.silent_failures = true;
  }
  return out;
}

nlohmann::json collect_additional_data(const CliOptions &opts) {
  nlohmann::json data = nlohmann::json::object();
  if (!opts.data_json.empty()) {
    data = nlohmann::json::parse(opts.data_json);
    if (!data.is_object()) {
      throw std::invalid_argument("--data-json must be a JSON object");
    }
  }
  for (auto &[key, value] : parse_key_values(opts.data).items()) {
    data[key] = value;
  }
  return data;
}

} // namespace

int App::run(int argc, char **argv) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &e) {
    return e.exit_code() == 0 ? kExitDelivered : kExitUsage;
  }

  auto level = spdlog::level::from_str(options_.log_level);
  init_logger(level, "", options_.log_file);
  install_default_logger();

  std::vector<std::shared_ptr<const ConfigSource>> sources;
  sources.push_back(std::make_shared<EnvConfigSource>());
  if (!options_.config_file.empty()) {
    try {
      sources.push_back(std::make_shared<FileConfigSource>(
          FileConfigSource::from_file(options_.config_file)));
    } catch (const ConfigurationError &e) {
      std::cerr << "huntglitch: " << e.what() << '\n';
      return kExitUsage;
    }
  }
  auto source = std::make_shared<ChainedConfigSource>(std::move(sources));

  std::unique_ptr<Logger> logger;
  try {
    logger = std::make_unique<Logger>(to_logger_options(options_), source,
                                      std::move(http_));
  } catch (const ConfigurationError &e) {
    std::cerr << "huntglitch: " << e.what() << '\n';
    return kExitUsage;
  }

  if (options_.check_config) {
    const auto &cfg = logger->config();
    std::cout << "configuration OK (source: " << source->describe()
              << ", timeout=" << cfg.timeout_seconds()
              << "s, retries=" << cfg.max_retries() << ", silent_failures="
              << (cfg.silent_failures() ? "true" : "false") << ")\n";
    return kExitDelivered;
  }

  nlohmann::json data;
  Tags tags;
  try {
    data = collect_additional_data(options_);
    tags = parse_tags(options_.tags);
  } catch (const std::exception &e) {
    std::cerr << "huntglitch: " << e.what() << '\n';
    return kExitUsage;
  }

  LogRecord record = build_record(options_.error_name, options_.error_value,
                                  options_.source_file, options_.source_line,
                                  options_.severity, std::move(data),
                                  std::move(tags));
  try {
    DeliveryOutcome outcome = logger->deliver(record);
    if (outcome.delivered) {
      app_log()->info("Delivered '{}' in {} attempt(s)", record.error_name(),
                      outcome.attempts_made);
      return kExitDelivered;
    }
    return kExitDeliveryFailed;
  } catch (const DeliveryError &e) {
    std::cerr << "huntglitch: " << e.what() << '\n';
    return kExitDeliveryFailed;
  }
}

} // namespace hgl
