#include "reporting.hpp"
#include "log.hpp"
#include <utility>

namespace hgl {

namespace {

std::shared_ptr<spdlog::logger> reporting_log() {
  static auto logger = category_logger("reporting");
  return logger;
}

} // namespace

bool report_quietly(const Logger &logger, std::exception_ptr error,
                    nlohmann::json additional_data, Tags tags,
                    const SourceLocation &location) noexcept {
  try {
    return logger.report_exception(std::move(error), std::move(additional_data),
                                   std::move(tags), location);
  } catch (const std::exception &e) {
    reporting_log()->warn("Failed to report exception: {}", e.what());
  }
  return false;
}

ErrorReportingScope::ErrorReportingScope(const Logger &logger,
                                         std::string operation,
                                         nlohmann::json context,
                                         SourceLocation location)
    : logger_(logger), operation_(std::move(operation)),
      context_(std::move(context)), location_(std::move(location)),
      uncaught_on_entry_(std::uncaught_exceptions()) {
  if (!context_.is_object()) {
    context_ = nlohmann::json{{"context", std::move(context_)}};
  }
}

ErrorReportingScope::~ErrorReportingScope() {
  if (reported_ || std::uncaught_exceptions() <= uncaught_on_entry_) {
    return;
  }
  try {
    LogRecord record = build_record(
        "ScopeFailure",
        "Operation '" + operation_ + "' exited with an exception",
        location_.file, location_.line, Severity::Error, scope_data());
    logger_.deliver(record);
  } catch (const std::exception &e) {
    reporting_log()->warn("Failed to report failure of '{}': {}", operation_,
                          e.what());
  }
}

nlohmann::json ErrorReportingScope::scope_data() const {
  nlohmann::json data = context_;
  data["operation"] = operation_;
  return data;
}

} // namespace hgl
