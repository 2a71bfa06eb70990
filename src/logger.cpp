#include "logger.hpp"
#include "log.hpp"
#include <utility>

namespace hgl {

namespace {

std::shared_ptr<spdlog::logger> logger_log() {
  static auto logger = category_logger("logger");
  return logger;
}

std::unique_ptr<Transport> make_transport(const LoggerConfig &config,
                                          std::unique_ptr<HttpClient> http) {
  if (!http) {
    http = std::make_unique<CurlHttpClient>(
        static_cast<long>(config.timeout().count()));
  }
  return std::make_unique<Transport>(std::move(http));
}

} // namespace

Logger::Logger(const LoggerOptions &options,
               std::shared_ptr<const ConfigSource> source,
               std::unique_ptr<HttpClient> http)
    : config_(ConfigResolver(std::move(source)).resolve(options)),
      transport_(make_transport(config_, std::move(http))) {
  logger_log()->debug("HuntGlitch logger ready (timeout={}s, retries={}, "
                      "silent_failures={})",
                      config_.timeout_seconds(), config_.max_retries(),
                      config_.silent_failures());
}

Logger::Logger(LoggerConfig config, std::unique_ptr<Transport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
  if (!transport_) {
    transport_ = make_transport(config_, nullptr);
  }
}

bool Logger::send_log(std::string error_name, std::string error_value,
                      std::string file_name, int line_number,
                      SeverityValue log_type, nlohmann::json additional_data,
                      Tags tags) const {
  LogRecord record =
      build_record(std::move(error_name), std::move(error_value),
                   std::move(file_name), line_number, log_type,
                   std::move(additional_data), std::move(tags));
  return deliver(record).delivered;
}

bool Logger::capture_exception(nlohmann::json additional_data, Tags tags,
                               SourceLocation location) const {
  return report_exception(std::current_exception(), std::move(additional_data),
                          std::move(tags), std::move(location));
}

bool Logger::report_exception(std::exception_ptr error,
                              nlohmann::json additional_data, Tags tags,
                              SourceLocation location) const {
  if (!error) {
    const char *message =
        "capture_exception called with no exception being handled";
    if (config_.silent_failures()) {
      logger_log()->warn(message);
      return false;
    }
    logger_log()->error(message);
    throw UsageError(message);
  }
  LogRecord record = build_record_from_exception(
      std::move(error), std::move(location), std::move(additional_data),
      std::move(tags));
  return deliver(record).delivered;
}

DeliveryOutcome Logger::deliver(const LogRecord &record) const {
  return transport_->deliver(config_, record);
}

} // namespace hgl
