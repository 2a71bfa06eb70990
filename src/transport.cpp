/**
 * @file transport.cpp
 * @brief Serialisation and retrying delivery of log records.
 */

#include "transport.hpp"
#include "log.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

namespace hgl {

namespace {

std::shared_ptr<spdlog::logger> transport_log() {
  static auto logger = category_logger("transport");
  return logger;
}

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

/// Cut @p value to at most @p limit bytes without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string &value, std::size_t limit) {
  if (value.size() <= limit) {
    return value;
  }
  std::size_t cut = limit;
  while (cut > 0 &&
         (static_cast<unsigned char>(value[cut]) & 0xC0U) == 0x80U) {
    --cut;
  }
  return value.substr(0, cut);
}

const std::vector<std::string> &request_headers() {
  static const std::vector<std::string> headers = {
      "Content-Type: application/json", "Accept: application/json"};
  return headers;
}

} // namespace

std::chrono::milliseconds BackoffPolicy::delay_for(int retry) const {
  if (initial.count() <= 0) {
    return std::chrono::milliseconds(0);
  }
  auto delay = initial;
  for (int i = 0; i < retry && delay < max; ++i) {
    delay *= 2;
  }
  return std::min(delay, std::max(max, initial));
}

nlohmann::json record_to_json(const LoggerConfig &config,
                              const LogRecord &record) {
  nlohmann::json tags = nlohmann::json::object();
  for (const auto &[key, value] : record.tags()) {
    tags[key] = value;
  }
  return nlohmann::json{
      {"project_key", config.project_key()},
      {"deliverable_key", config.deliverable_key()},
      {"error_name", record.error_name()},
      {"error_value", record.error_value()},
      {"source_file", record.source_file()},
      {"source_line", record.source_line()},
      {"severity", to_string(record.severity())},
      {"additional_data", record.additional_data()},
      {"tags", std::move(tags)},
      {"timestamp", iso_timestamp(std::chrono::system_clock::now())}};
}

std::string encode_payload(const LoggerConfig &config,
                           const LogRecord &record) {
  nlohmann::json body = record_to_json(config, record);
  std::string payload = body.dump();
  if (payload.size() <= kMaxPayloadBytes) {
    return payload;
  }
  const std::size_t original = payload.size();
  auto fits = [&payload] { return payload.size() <= kMaxPayloadBytes; };

  if (!record.additional_data().empty()) {
    body["additional_data"] = {{"_truncated", true},
                               {"_original_bytes", original}};
    payload = body.dump();
  }
  if (!fits() && !record.tags().empty()) {
    body["tags"] = {{"_truncated", "true"}};
    payload = body.dump();
  }
  if (!fits()) {
    body["error_value"] = truncate_utf8(record.error_value(), kMaxFieldBytes);
    body["error_name"] = truncate_utf8(record.error_name(), kMaxFieldBytes);
    body["source_file"] = truncate_utf8(record.source_file(), kMaxFieldBytes);
    payload = body.dump();
  }
  if (!fits()) {
    throw PayloadTooLargeError("Record '" +
                               truncate_utf8(record.error_name(), 64) +
                               "' is " + std::to_string(payload.size()) +
                               " bytes after truncation, limit is " +
                               std::to_string(kMaxPayloadBytes));
  }
  transport_log()->warn("Record '{}' truncated from {} to {} bytes",
                        truncate_utf8(record.error_name(), 64), original,
                        payload.size());
  return payload;
}

Transport::Transport(std::unique_ptr<HttpClient> http, std::string endpoint,
                     BackoffPolicy backoff, Sleeper sleeper)
    : http_(std::move(http)), endpoint_(std::move(endpoint)),
      backoff_(backoff), sleeper_(std::move(sleeper)) {
  if (!http_) {
    throw UsageError("Transport requires an HTTP client");
  }
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
  }
}

DeliveryOutcome Transport::deliver(const LoggerConfig &config,
                                   const LogRecord &record) const {
  DeliveryOutcome outcome;
  std::string body;
  try {
    body = encode_payload(config, record);
  } catch (const nlohmann::json::exception &e) {
    outcome.last_error = std::string("Failed to serialise record: ") + e.what();
    return fail(config, record, std::move(outcome));
  } catch (const PayloadTooLargeError &e) {
    outcome.last_error = e.what();
    return fail(config, record, std::move(outcome));
  }

  const int max_attempts = config.max_retries() + 1;
  while (true) {
    ++outcome.attempts_made;
    bool retryable = false;
    try {
      transport_log()->debug("POST {} attempt {}/{} ({} bytes)", endpoint_,
                             outcome.attempts_made, max_attempts, body.size());
      HttpResponse response = http_->post(endpoint_, body, request_headers());
      if (response.status_code < 200 || response.status_code >= 300) {
        throw HttpStatusError(static_cast<int>(response.status_code),
                              "HTTP code " +
                                  std::to_string(response.status_code));
      }
      outcome.delivered = true;
      outcome.last_status = response.status_code;
      outcome.last_error.reset();
      transport_log()->debug("Record '{}' accepted after {} attempt(s): {}",
                             record.error_name(), outcome.attempts_made,
                             response.body);
      return outcome;
    } catch (const HttpStatusError &e) {
      outcome.last_status = e.status;
      outcome.last_error = e.what();
      retryable = e.is_server_error();
    } catch (const TransientNetworkError &e) {
      outcome.last_status = 0;
      outcome.last_error = e.what();
      retryable = true;
    } catch (const std::exception &e) {
      outcome.last_error = e.what();
    }
    if (!retryable || outcome.attempts_made >= max_attempts) {
      break;
    }
    auto delay = backoff_.delay_for(outcome.attempts_made - 1);
    transport_log()->warn("Delivery attempt {}/{} failed ({}); retrying in {} ms",
                          outcome.attempts_made, max_attempts,
                          outcome.last_error.value_or("unknown error"),
                          delay.count());
    sleeper_(delay);
  }
  return fail(config, record, std::move(outcome));
}

DeliveryOutcome Transport::fail(const LoggerConfig &config,
                                const LogRecord &record,
                                DeliveryOutcome outcome) const {
  std::string message = "Failed to deliver '" + record.error_name() +
                        "' after " + std::to_string(outcome.attempts_made) +
                        " attempt(s): " +
                        outcome.last_error.value_or("unknown error");
  if (config.silent_failures()) {
    transport_log()->warn(message);
    return outcome;
  }
  transport_log()->error(message);
  throw DeliveryError(message, std::move(outcome));
}

} // namespace hgl
