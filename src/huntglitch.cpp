#include "huntglitch.hpp"
#include "log.hpp"
#include <mutex>
#include <optional>
#include <utility>

namespace hgl {

namespace {

std::shared_ptr<spdlog::logger> report_log() {
  static auto logger = category_logger("report");
  return logger;
}

std::mutex g_factory_mutex;
HttpClientFactory g_factory;

/// Build a logger from the environment; nullopt (already logged) on error.
std::optional<Logger> environment_logger() {
  HttpClientFactory factory;
  {
    std::lock_guard<std::mutex> lock(g_factory_mutex);
    factory = g_factory;
  }
  try {
    auto config = ConfigResolver().resolve();
    std::unique_ptr<HttpClient> http;
    if (factory) {
      http = factory(config);
    }
    return std::optional<Logger>(
        std::in_place, config,
        http ? std::make_unique<Transport>(std::move(http)) : nullptr);
  } catch (const ConfigurationError &e) {
    report_log()->error("HuntGlitch is not configured: {}", e.what());
  } catch (const std::exception &e) {
    report_log()->error("Failed to create HuntGlitch logger: {}", e.what());
  }
  return std::nullopt;
}

void log_failure(const Logger &logger, const std::exception &e) {
  if (logger.config().silent_failures()) {
    report_log()->warn("HuntGlitch report failed: {}", e.what());
  } else {
    report_log()->error("HuntGlitch report failed: {}", e.what());
  }
}

} // namespace

void set_http_client_factory(HttpClientFactory factory) {
  std::lock_guard<std::mutex> lock(g_factory_mutex);
  g_factory = std::move(factory);
}

bool send_huntglitch_log(std::string error_name, std::string error_value,
                         std::string file_name, int line_number,
                         SeverityValue log_type, nlohmann::json additional_data,
                         Tags tags) noexcept {
  try {
    auto logger = environment_logger();
    if (!logger) {
      return false;
    }
    try {
      return logger->send_log(std::move(error_name), std::move(error_value),
                              std::move(file_name), line_number, log_type,
                              std::move(additional_data), std::move(tags));
    } catch (const std::exception &e) {
      log_failure(*logger, e);
    }
  } catch (const std::exception &e) {
    report_log()->error("HuntGlitch report failed: {}", e.what());
  }
  return false;
}

bool capture_exception_and_report(nlohmann::json additional_data, Tags tags,
                                  SourceLocation location) noexcept {
  std::exception_ptr error = std::current_exception();
  try {
    auto logger = environment_logger();
    if (!logger) {
      return false;
    }
    if (!error) {
      log_failure(*logger,
                  UsageError("capture_exception_and_report called with no "
                             "exception being handled"));
      return false;
    }
    try {
      return logger->report_exception(error, std::move(additional_data),
                                      std::move(tags), std::move(location));
    } catch (const std::exception &e) {
      log_failure(*logger, e);
    }
  } catch (const std::exception &e) {
    report_log()->error("HuntGlitch report failed: {}", e.what());
  }
  return false;
}

} // namespace hgl
