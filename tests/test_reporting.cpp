#include "errors.hpp"
#include "reporting.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hgl;

namespace {

class CapturingHttp : public HttpClient {
public:
  int calls = 0;
  bool fail = false;
  std::vector<nlohmann::json> bodies;
  HttpResponse post(const std::string &, const std::string &data,
                    const std::vector<std::string> &) override {
    ++calls;
    bodies.push_back(nlohmann::json::parse(data));
    if (fail)
      throw HttpStatusError(500, "HTTP 500");
    return {"", 200};
  }
};

Logger make_logger(CapturingHttp *&raw, bool silent = false) {
  auto http = std::make_unique<CapturingHttp>();
  raw = http.get();
  auto transport = std::make_unique<Transport>(
      std::move(http), kLighthouseEndpoint,
      BackoffPolicy{std::chrono::milliseconds(0), std::chrono::milliseconds(0)});
  return Logger(LoggerConfig::create("p", "d", 1.0, 0, silent),
                std::move(transport));
}

int divide(int a, int b) {
  if (b == 0)
    throw std::domain_error("division by zero");
  return a / b;
}

} // namespace

TEST_CASE("with_error_reporting passes results through") {
  CapturingHttp *raw = nullptr;
  Logger logger = make_logger(raw);
  auto safe_divide = with_error_reporting(logger, "divide", divide);
  REQUIRE(safe_divide(10, 2) == 5);
  REQUIRE(raw->calls == 0);
}

TEST_CASE("with_error_reporting reports and rethrows") {
  CapturingHttp *raw = nullptr;
  Logger logger = make_logger(raw);
  auto safe_divide =
      with_error_reporting(logger, "divide", divide, {{"caller", "test"}});
  REQUIRE_THROWS_AS(safe_divide(1, 0), std::domain_error);
  REQUIRE(raw->calls == 1);
  const auto &body = raw->bodies.front();
  REQUIRE(body["error_name"] == "std::domain_error");
  REQUIRE(body["error_value"] == "division by zero");
  REQUIRE(body["additional_data"]["function_name"] == "divide");
  REQUIRE(body["additional_data"]["caller"] == "test");
}

TEST_CASE("with_error_reporting keeps the original exception when delivery fails") {
  CapturingHttp *raw = nullptr;
  Logger logger = make_logger(raw);
  raw->fail = true;
  auto wrapped = with_error_reporting(logger, "task", [](const std::string &s) {
    throw std::invalid_argument("bad " + s);
  });
  try {
    wrapped(std::string("input"));
    FAIL("expected invalid_argument");
  } catch (const std::invalid_argument &e) {
    REQUIRE(std::string(e.what()) == "bad input");
  }
  REQUIRE(raw->calls == 1);
}

TEST_CASE("with_error_reporting rejects empty callables") {
  CapturingHttp *raw = nullptr;
  Logger logger = make_logger(raw);
  std::function<void()> empty;
  REQUIRE_THROWS_AS(with_error_reporting(logger, "empty", empty), UsageError);
  int (*null_fn)(int, int) = nullptr;
  REQUIRE_THROWS_AS(with_error_reporting(logger, "null", null_fn), UsageError);
}

TEST_CASE("scope reports only on failure exit") {
  CapturingHttp *raw = nullptr;
  Logger logger = make_logger(raw);
  {
    ErrorReportingScope scope(logger, "quiet_operation");
    REQUIRE(scope.operation() == "quiet_operation");
    REQUIRE_FALSE(scope.reported());
  }
  REQUIRE(raw->calls == 0);

  try {
    ErrorReportingScope scope(logger, "database_operation",
                              {{"table", "users"}}, {"db.cpp", 21});
    throw std::runtime_error("constraint violated");
  } catch (const std::runtime_error &) {
  }
  REQUIRE(raw->calls == 1);
  const auto &body = raw->bodies.front();
  REQUIRE(body["error_name"] == "ScopeFailure");
  REQUIRE(body["severity"] == "error");
  REQUIRE(body["source_file"] == "db.cpp");
  REQUIRE(body["source_line"] == 21);
  REQUIRE(body["additional_data"]["operation"] == "database_operation");
  REQUIRE(body["additional_data"]["table"] == "users");
}

TEST_CASE("scope run reports the actual exception once") {
  CapturingHttp *raw = nullptr;
  Logger logger = make_logger(raw);
  bool reported = false;
  try {
    ErrorReportingScope scope(logger, "import");
    REQUIRE(scope.run([] { return 3; }) == 3);
    REQUIRE_FALSE(scope.reported());
    try {
      scope.run([] { throw std::length_error("too long"); });
    } catch (const std::length_error &) {
      reported = scope.reported();
      throw;
    }
  } catch (const std::length_error &) {
  }
  REQUIRE(reported);
  REQUIRE(raw->calls == 1);
  REQUIRE(raw->bodies.front()["error_name"] == "std::length_error");
  REQUIRE(raw->bodies.front()["additional_data"]["operation"] == "import");
}

TEST_CASE("scope swallows delivery failures") {
  CapturingHttp *raw = nullptr;
  Logger logger = make_logger(raw);
  raw->fail = true;
  bool caught = false;
  try {
    ErrorReportingScope scope(logger, "flaky");
    throw std::runtime_error("original");
  } catch (const std::runtime_error &e) {
    caught = std::string(e.what()) == "original";
  }
  REQUIRE(caught);
  REQUIRE(raw->calls == 1);
}
