#include "errors.hpp"
#include "transport.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

using namespace hgl;

namespace {

class RecordingHttp : public HttpClient {
public:
  int calls = 0;
  std::string last_url;
  std::string last_body;
  std::vector<std::string> last_headers;
  HttpResponse post(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override {
    ++calls;
    last_url = url;
    last_body = data;
    last_headers = headers;
    return {"{\"ok\":true}", 200};
  }
};

class FlakyHttp : public HttpClient {
public:
  int calls = 0;
  int failures = 0;
  HttpResponse post(const std::string &, const std::string &,
                    const std::vector<std::string> &) override {
    if (calls++ < failures)
      throw TransientNetworkError("connection reset");
    return {"", 201};
  }
};

class StatusHttp : public HttpClient {
public:
  int calls = 0;
  int status = 500;
  HttpResponse post(const std::string &, const std::string &,
                    const std::vector<std::string> &) override {
    ++calls;
    throw HttpStatusError(status, "HTTP " + std::to_string(status));
  }
};

class StatusResponseHttp : public HttpClient {
public:
  int calls = 0;
  long status = 403;
  HttpResponse post(const std::string &, const std::string &,
                    const std::vector<std::string> &) override {
    ++calls;
    return {"nope", status};
  }
};

LoggerConfig make_config(int retries, bool silent) {
  return LoggerConfig::create("proj", "deliv", 1.0, retries, silent);
}

LogRecord sample_record() {
  return build_record("Boom", "something broke", "app.cpp", 12, "warning",
                      {{"a", 1}, {"b", "x"}}, {{"env", "test"}});
}

template <typename H> Transport make_transport(H *&raw, std::vector<long> *delays = nullptr) {
  auto http = std::make_unique<H>();
  raw = http.get();
  return Transport(std::move(http), "http://collector.test/api/log/add",
                   BackoffPolicy{}, [delays](std::chrono::milliseconds d) {
                     if (delays)
                       delays->push_back(static_cast<long>(d.count()));
                   });
}

} // namespace

TEST_CASE("transport delivers once on success") {
  RecordingHttp *raw = nullptr;
  Transport transport = make_transport(raw);
  DeliveryOutcome outcome = transport.deliver(make_config(3, false), sample_record());
  REQUIRE(outcome.delivered);
  REQUIRE(outcome.attempts_made == 1);
  REQUIRE(outcome.last_status == 200);
  REQUIRE_FALSE(outcome.last_error.has_value());
  REQUIRE(raw->calls == 1);
  REQUIRE(raw->last_url == "http://collector.test/api/log/add");
  REQUIRE(transport.endpoint() == raw->last_url);

  auto body = nlohmann::json::parse(raw->last_body);
  REQUIRE(body["project_key"] == "proj");
  REQUIRE(body["deliverable_key"] == "deliv");
  REQUIRE(body["error_name"] == "Boom");
  REQUIRE(body["error_value"] == "something broke");
  REQUIRE(body["source_file"] == "app.cpp");
  REQUIRE(body["source_line"] == 12);
  REQUIRE(body["severity"] == "warning");
  REQUIRE(body["additional_data"] == nlohmann::json{{"a", 1}, {"b", "x"}});
  REQUIRE(body["tags"]["env"] == "test");
  REQUIRE(body["timestamp"].get<std::string>().back() == 'Z');

  bool has_content_type = false;
  for (const auto &h : raw->last_headers) {
    if (h == "Content-Type: application/json")
      has_content_type = true;
  }
  REQUIRE(has_content_type);
}

TEST_CASE("transport retries transient failures") {
  FlakyHttp *raw = nullptr;
  std::vector<long> delays;
  Transport transport = make_transport(raw, &delays);
  raw->failures = 2;
  DeliveryOutcome outcome = transport.deliver(make_config(3, false), sample_record());
  REQUIRE(outcome.delivered);
  REQUIRE(outcome.attempts_made == 3);
  REQUIRE(raw->calls == 3);
  REQUIRE(delays == std::vector<long>{250, 500});
}

TEST_CASE("transport gives up after max retries") {
  SECTION("silent") {
    StatusHttp *raw = nullptr;
    Transport transport = make_transport(raw);
    DeliveryOutcome outcome = transport.deliver(make_config(2, true), sample_record());
    REQUIRE_FALSE(outcome.delivered);
    REQUIRE(outcome.attempts_made == 3);
    REQUIRE(outcome.last_status == 500);
    REQUIRE(outcome.last_error.has_value());
    REQUIRE(raw->calls == 3);
  }
  SECTION("loud") {
    StatusHttp *raw = nullptr;
    Transport transport = make_transport(raw);
    try {
      transport.deliver(make_config(2, false), sample_record());
      FAIL("expected DeliveryError");
    } catch (const DeliveryError &e) {
      REQUIRE(e.outcome().attempts_made == 3);
      REQUIRE(e.outcome().last_status == 500);
      REQUIRE(std::string(e.what()).find("Boom") != std::string::npos);
    }
    REQUIRE(raw->calls == 3);
  }
  SECTION("no retries") {
    FlakyHttp *raw = nullptr;
    Transport transport = make_transport(raw);
    raw->failures = 5;
    DeliveryOutcome outcome = transport.deliver(make_config(0, true), sample_record());
    REQUIRE_FALSE(outcome.delivered);
    REQUIRE(outcome.attempts_made == 1);
    REQUIRE(raw->calls == 1);
  }
}

TEST_CASE("transport does not retry client errors") {
  StatusHttp *raw = nullptr;
  Transport transport = make_transport(raw);
  raw->status = 422;
  DeliveryOutcome outcome = transport.deliver(make_config(3, true), sample_record());
  REQUIRE_FALSE(outcome.delivered);
  REQUIRE(outcome.attempts_made == 1);
  REQUIRE(outcome.last_status == 422);
  REQUIRE(raw->calls == 1);

  StatusResponseHttp *plain = nullptr;
  Transport transport2 = make_transport(plain);
  REQUIRE_THROWS_AS(transport2.deliver(make_config(3, false), sample_record()),
                    DeliveryError);
  REQUIRE(plain->calls == 1);
}

TEST_CASE("transport retries server errors answered without throwing") {
  StatusResponseHttp *raw = nullptr;
  std::vector<long> delays;
  Transport transport = make_transport(raw, &delays);
  raw->status = 503;
  DeliveryOutcome outcome = transport.deliver(make_config(2, true), sample_record());
  REQUIRE_FALSE(outcome.delivered);
  REQUIRE(outcome.attempts_made == 3);
  REQUIRE(outcome.last_status == 503);
  REQUIRE(raw->calls == 3);
  REQUIRE(delays == std::vector<long>{250, 500});
}

TEST_CASE("transport only accepts 2xx answers") {
  StatusResponseHttp *raw = nullptr;
  Transport transport = make_transport(raw);
  SECTION("no status") {
    raw->status = 0;
    DeliveryOutcome outcome = transport.deliver(make_config(3, true), sample_record());
    REQUIRE_FALSE(outcome.delivered);
    REQUIRE(outcome.attempts_made == 1);
    REQUIRE(raw->calls == 1);
  }
  SECTION("redirect") {
    raw->status = 302;
    DeliveryOutcome outcome = transport.deliver(make_config(3, true), sample_record());
    REQUIRE_FALSE(outcome.delivered);
    REQUIRE(outcome.last_status == 302);
    REQUIRE(raw->calls == 1);
  }
  SECTION("no content") {
    raw->status = 204;
    DeliveryOutcome outcome = transport.deliver(make_config(3, true), sample_record());
    REQUIRE(outcome.delivered);
    REQUIRE(outcome.last_status == 204);
  }
}

TEST_CASE("transport leaves the default logger alone") {
  auto host = std::make_shared<spdlog::logger>(
      "host-transport", std::make_shared<spdlog::sinks::null_sink_mt>());
  host->set_level(spdlog::level::info);
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(host);

  RecordingHttp *ok = nullptr;
  Transport delivered = make_transport(ok);
  REQUIRE(delivered.deliver(make_config(0, true), sample_record()).delivered);

  StatusHttp *failing = nullptr;
  Transport rejected = make_transport(failing);
  failing->status = 422;
  REQUIRE_FALSE(rejected.deliver(make_config(0, true), sample_record()).delivered);

  REQUIRE(spdlog::default_logger() == host);
  REQUIRE(host->level() == spdlog::level::info);
  REQUIRE(spdlog::get("huntglitch") == nullptr);
  REQUIRE(spdlog::get("huntglitch.transport") == nullptr);
  spdlog::set_default_logger(previous);
}

TEST_CASE("transport reports unserialisable records without sending") {
  RecordingHttp *raw = nullptr;
  Transport transport = make_transport(raw);
  LogRecord bad = build_record("Bad", std::string("\xff\xfe"), "f.cpp", 1, 3);
  DeliveryOutcome outcome = transport.deliver(make_config(3, true), bad);
  REQUIRE_FALSE(outcome.delivered);
  REQUIRE(outcome.attempts_made == 0);
  REQUIRE(raw->calls == 0);
  REQUIRE_THROWS_AS(transport.deliver(make_config(3, false), bad), DeliveryError);
  REQUIRE(raw->calls == 0);
}

TEST_CASE("payload truncation") {
  LoggerConfig cfg = make_config(0, false);
  std::string big(kMaxPayloadBytes + 10, 'x');
  LogRecord rec = build_record("Large", "value", "f.cpp", 1, 3, {{"blob", big}});
  auto body = nlohmann::json::parse(encode_payload(cfg, rec));
  REQUIRE(body["additional_data"]["_truncated"] == true);
  REQUIRE(body["additional_data"]["_original_bytes"].get<std::size_t>() >
          kMaxPayloadBytes);
  REQUIRE(body["error_value"] == "value");

  LogRecord huge_value = build_record("Large", big, "f.cpp", 1, 3);
  std::string payload = encode_payload(cfg, huge_value);
  REQUIRE(payload.size() <= kMaxPayloadBytes);
  auto body2 = nlohmann::json::parse(payload);
  REQUIRE(body2["error_value"].get<std::string>().size() == kMaxFieldBytes);
  REQUIRE(body2["additional_data"].empty());

  LogRecord small = sample_record();
  auto body3 = nlohmann::json::parse(encode_payload(cfg, small));
  REQUIRE(body3["additional_data"] == small.additional_data());
}

TEST_CASE("payload truncation covers tags and names") {
  LoggerConfig cfg = make_config(0, false);
  std::string big(kMaxPayloadBytes + 10, 'y');

  SECTION("oversized tags") {
    LogRecord rec = build_record("Tagged", "value", "f.cpp", 1, 3, {{"a", 1}},
                                 {{"huge", big}});
    std::string payload = encode_payload(cfg, rec);
    REQUIRE(payload.size() <= kMaxPayloadBytes);
    auto body = nlohmann::json::parse(payload);
    REQUIRE(body["tags"] == nlohmann::json{{"_truncated", "true"}});
    REQUIRE(body["additional_data"]["_truncated"] == true);
    REQUIRE(body["error_name"] == "Tagged");
  }
  SECTION("oversized error name") {
    LogRecord rec = build_record(big, "value", "f.cpp", 1, 3);
    std::string payload = encode_payload(cfg, rec);
    REQUIRE(payload.size() <= kMaxPayloadBytes);
    auto body = nlohmann::json::parse(payload);
    REQUIRE(body["error_name"].get<std::string>().size() == kMaxFieldBytes);
    REQUIRE(body["error_value"] == "value");
  }
  SECTION("oversized source file") {
    LogRecord rec = build_record("Path", "value", big, 1, 3);
    std::string payload = encode_payload(cfg, rec);
    REQUIRE(payload.size() <= kMaxPayloadBytes);
    auto body = nlohmann::json::parse(payload);
    REQUIRE(body["source_file"].get<std::string>().size() == kMaxFieldBytes);
  }
}

TEST_CASE("payload that cannot be reduced is not sent") {
  LoggerConfig cfg = LoggerConfig::create(std::string(kMaxPayloadBytes, 'k'),
                                          "deliv", 1.0, 3, true);
  LogRecord rec = sample_record();
  REQUIRE_THROWS_AS(encode_payload(cfg, rec), PayloadTooLargeError);

  RecordingHttp *raw = nullptr;
  Transport transport = make_transport(raw);
  DeliveryOutcome outcome = transport.deliver(cfg, rec);
  REQUIRE_FALSE(outcome.delivered);
  REQUIRE(outcome.attempts_made == 0);
  REQUIRE(outcome.last_error.has_value());
  REQUIRE(raw->calls == 0);
}

TEST_CASE("backoff policy") {
  BackoffPolicy policy;
  REQUIRE(policy.delay_for(0).count() == 250);
  REQUIRE(policy.delay_for(1).count() == 500);
  REQUIRE(policy.delay_for(2).count() == 1000);
  REQUIRE(policy.delay_for(3).count() == 2000);
  REQUIRE(policy.delay_for(10).count() == 2000);

  BackoffPolicy none{std::chrono::milliseconds(0), std::chrono::milliseconds(0)};
  REQUIRE(none.delay_for(4).count() == 0);
}

TEST_CASE("transport keeps its backoff policy") {
  RecordingHttp *raw = nullptr;
  Transport transport = make_transport(raw);
  REQUIRE(transport.backoff().initial.count() == 250);
  REQUIRE(transport.backoff().max.count() == 2000);

  Transport fast(std::make_unique<RecordingHttp>(), kLighthouseEndpoint,
                 BackoffPolicy{std::chrono::milliseconds(10),
                               std::chrono::milliseconds(15)});
  REQUIRE(fast.endpoint() == kLighthouseEndpoint);
  REQUIRE(fast.backoff().delay_for(3).count() == 15);
}

TEST_CASE("transport requires an http client") {
  REQUIRE_THROWS_AS(Transport(nullptr), UsageError);
}
