#include "log_record.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace hgl {

namespace {

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

nlohmann::json normalize_additional_data(nlohmann::json data) {
  if (data.is_null()) {
    return nlohmann::json::object();
  }
  if (!data.is_object()) {
    return nlohmann::json{{"value", std::move(data)}};
  }
  return data;
}

/// One exception in a (possibly nested) chain.
struct ChainEntry {
  std::string type;
  std::string message;
  std::optional<SourceLocation> location;
};

/**
 * Strip the wrapper std::throw_with_nested adds around the thrown type.
 */
std::string unwrap_nested_type(std::string name) {
  for (const char *prefix : {"std::_Nested_exception<", "std::__nested<",
                             "std::__1::__nested<"}) {
    const std::string p(prefix);
    if (name.size() > p.size() + 1 && name.compare(0, p.size(), p) == 0 &&
        name.back() == '>') {
      return name.substr(p.size(), name.size() - p.size() - 1);
    }
  }
  return name;
}

/// Flatten an exception and everything nested inside it, outermost first.
std::vector<ChainEntry> unwind_chain(std::exception_ptr error) {
  std::vector<ChainEntry> chain;
  while (error) {
    std::exception_ptr next;
    try {
      std::rethrow_exception(error);
    } catch (const std::exception &e) {
      ChainEntry entry;
      if (const auto *located = dynamic_cast<const LocatedError *>(&e)) {
        entry.type = demangle(located->thrown_type());
        entry.location = located->location();
      } else {
        entry.type = unwrap_nested_type(demangle(typeid(e)));
      }
      entry.message = e.what();
      chain.push_back(std::move(entry));
      if (const auto *nested = dynamic_cast<const std::nested_exception *>(&e)) {
        next = nested->nested_ptr();
      }
    } catch (...) {
      chain.push_back({"unknown", "Unknown exception", std::nullopt});
    }
    error = next;
  }
  return chain;
}

} // namespace

Severity parse_severity(const std::string &name) {
  const std::string lower = to_lower_copy(name);
  if (lower == "info" || lower == "debug") {
    return Severity::Info;
  }
  if (lower == "warning" || lower == "warn") {
    return Severity::Warning;
  }
  if (lower == "error") {
    return Severity::Error;
  }
  if (lower == "critical" || lower == "fatal") {
    return Severity::Critical;
  }
  if (!lower.empty() &&
      std::all_of(lower.begin(), lower.end(),
                  [](unsigned char c) { return std::isdigit(c); }) &&
      lower.size() < 10) {
    return severity_from_code(std::stoll(lower));
  }
  return kFallbackSeverity;
}

Severity severity_from_code(long long code) {
  switch (code) {
  case 1:
    return Severity::Info;
  case 2:
    return Severity::Warning;
  case 3:
    return Severity::Error;
  case 4:
    return Severity::Critical;
  default:
    return kFallbackSeverity;
  }
}

const char *to_string(Severity severity) {
  switch (severity) {
  case Severity::Info:
    return "info";
  case Severity::Warning:
    return "warning";
  case Severity::Error:
    return "error";
  case Severity::Critical:
    return "critical";
  }
  return "error";
}

std::string demangle(const std::type_info &type) {
#if defined(__GNUG__)
  int status = 0;
  std::unique_ptr<char, void (*)(void *)> name(
      abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), std::free);
  if (status == 0 && name) {
    return name.get();
  }
#endif
  return type.name();
}

LogRecord build_record(std::string error_name, std::string error_value,
                       std::string source_file, int source_line,
                       SeverityValue severity, nlohmann::json additional_data,
                       Tags tags) {
  return LogRecord(std::move(error_name), std::move(error_value),
                   std::move(source_file), std::max(0, source_line),
                   severity.get(),
                   normalize_additional_data(std::move(additional_data)),
                   std::move(tags));
}

LogRecord build_record_from_exception(std::exception_ptr error,
                                      SourceLocation fallback,
                                      nlohmann::json additional_data,
                                      Tags tags) {
  if (!error) {
    throw UsageError(
        "No active exception to capture; call from inside a catch handler");
  }
  const auto chain = unwind_chain(std::move(error));
  const ChainEntry &outer = chain.front();

  SourceLocation location = std::move(fallback);
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
    if (it->location) {
      location = *it->location;
      break;
    }
  }

  nlohmann::json data = normalize_additional_data(std::move(additional_data));
  if (chain.size() > 1) {
    nlohmann::json frames = nlohmann::json::array();
    for (const auto &entry : chain) {
      frames.push_back({{"type", entry.type}, {"message", entry.message}});
    }
    data["exception_chain"] = std::move(frames);
  }

  return LogRecord(outer.type, outer.message, std::move(location.file),
                   std::max(0, location.line), Severity::Error,
                   std::move(data), std::move(tags));
}

} // namespace hgl
