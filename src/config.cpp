#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace hgl {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = category_logger("config");
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string trim_copy(const std::string &value) {
  auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * The conversion preserves scalar types where possible and recursively maps
 * sequences and maps to JSON arrays and objects respectively.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    try {
      size_t idx = 0;
      long long i = std::stoll(s, &idx, 10);
      if (idx == s.size())
        return i;
    } catch (const std::exception &) {
    }
    try {
      size_t idx = 0;
      double d = std::stod(s, &idx);
      if (idx == s.size())
        return d;
    } catch (const std::exception &) {
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  return nullptr;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * configuration files expose the same flat keys as flat ones.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section :
       {"huntglitch", "credentials", "network"}) {
    merge_section(section);
  }

  return normalized;
}

/// File keys (and aliases) mapped to their source names.
const std::pair<const char *, const char *> kFileKeys[] = {
    {"project_key", kProjectKeyName},
    {"deliverable_key", kDeliverableKeyName},
    {"timeout", kTimeoutName},
    {"timeout_seconds", kTimeoutName},
    {"retries", kRetriesName},
    {"max_retries", kRetriesName},
    {"silent_failures", kSilentFailuresName},
};

std::string scalar_to_string(const nlohmann::json &value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump();
}

std::unordered_map<std::string, std::string>
flatten_settings(const nlohmann::json &doc, const std::string &path) {
  if (!doc.is_object()) {
    throw ConfigurationError("Configuration file " + path +
                             " must contain a mapping at the top level");
  }
  nlohmann::json cfg = normalize_config_sections(doc);
  std::unordered_map<std::string, std::string> values;
  for (const auto &[key, name] : kFileKeys) {
    auto it = cfg.find(key);
    if (it == cfg.end() || it->is_null()) {
      continue;
    }
    if (it->is_structured()) {
      throw ConfigurationError(std::string("Configuration key '") + key +
                               "' in " + path + " must be a scalar");
    }
    values[name] = scalar_to_string(*it);
  }
  return values;
}

std::optional<double> parse_double(const std::string &value) {
  try {
    size_t idx = 0;
    double d = std::stod(value, &idx);
    if (idx != value.size()) {
      return std::nullopt;
    }
    return d;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<int> parse_int(const std::string &value) {
  try {
    size_t idx = 0;
    int i = std::stoi(value, &idx, 10);
    if (idx != value.size()) {
      return std::nullopt;
    }
    return i;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<std::string> non_empty(std::optional<std::string> value) {
  if (value) {
    *value = trim_copy(*value);
    if (value->empty()) {
      return std::nullopt;
    }
  }
  return value;
}

} // namespace

std::optional<bool> parse_bool(const std::string &value) {
  const std::string v = to_lower_copy(trim_copy(value));
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "off") {
    return false;
  }
  return std::nullopt;
}

LoggerConfig::LoggerConfig(std::string project_key, std::string deliverable_key,
                           double timeout_seconds, int max_retries,
                           bool silent_failures)
    : project_key_(std::move(project_key)),
      deliverable_key_(std::move(deliverable_key)),
      timeout_seconds_(timeout_seconds), max_retries_(max_retries),
      silent_failures_(silent_failures) {}

LoggerConfig LoggerConfig::create(std::string project_key,
                                  std::string deliverable_key,
                                  double timeout_seconds, int max_retries,
                                  bool silent_failures) {
  std::vector<std::string> missing;
  if (project_key.empty()) {
    missing.emplace_back(kProjectKeyName);
  }
  if (deliverable_key.empty()) {
    missing.emplace_back(kDeliverableKeyName);
  }
  if (!missing.empty()) {
    std::string names = missing.front();
    if (missing.size() > 1) {
      names += " and " + missing.back();
    }
    throw ConfigurationError("Missing required HuntGlitch configuration: " +
                             names);
  }
  if (!std::isfinite(timeout_seconds) || timeout_seconds <= 0.0) {
    throw ConfigurationError("timeout_seconds must be a positive number");
  }
  if (max_retries < 0) {
    throw ConfigurationError("max_retries must not be negative");
  }
  return LoggerConfig(std::move(project_key), std::move(deliverable_key),
                      timeout_seconds, max_retries, silent_failures);
}

std::chrono::milliseconds LoggerConfig::timeout() const {
  return std::chrono::milliseconds(
      static_cast<long long>(std::llround(timeout_seconds_ * 1000.0)));
}

std::optional<std::string>
EnvConfigSource::lookup(const std::string &name) const {
  const char *env = std::getenv(name.c_str());
  if (env == nullptr) {
    return std::nullopt;
  }
  return std::string(env);
}

std::optional<std::string>
MapConfigSource::lookup(const std::string &name) const {
  auto it = values_.find(name);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

FileConfigSource FileConfigSource::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw ConfigurationError("Unknown config file extension: " + path);
  }
  const std::string ext = to_lower_copy(path.substr(pos + 1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw std::runtime_error("Unsupported config format: " + ext);
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw ConfigurationError("Failed to load config " + path + ": " +
                             e.what());
  }
  auto values = flatten_settings(j, path);
  config_log()->debug("Config loaded from {} ({} setting(s))", path,
                      values.size());
  return FileConfigSource(path, std::move(values));
}

std::optional<std::string>
FileConfigSource::lookup(const std::string &name) const {
  auto it = values_.find(name);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string>
ChainedConfigSource::lookup(const std::string &name) const {
  for (const auto &source : sources_) {
    if (!source) {
      continue;
    }
    auto value = source->lookup(name);
    if (value && !trim_copy(*value).empty()) {
      return value;
    }
  }
  return std::nullopt;
}

std::string ChainedConfigSource::describe() const {
  std::string out;
  for (const auto &source : sources_) {
    if (!source) {
      continue;
    }
    if (!out.empty()) {
      out += " > ";
    }
    out += source->describe();
  }
  return out;
}

ConfigResolver::ConfigResolver(std::shared_ptr<const ConfigSource> source)
    : source_(std::move(source)) {
  if (!source_) {
    source_ = std::make_shared<EnvConfigSource>();
  }
}

LoggerConfig ConfigResolver::resolve(const LoggerOptions &overrides) const {
  auto project_key = non_empty(overrides.project_key);
  if (!project_key) {
    project_key = non_empty(source_->lookup(kProjectKeyName));
  }
  auto deliverable_key = non_empty(overrides.deliverable_key);
  if (!deliverable_key) {
    deliverable_key = non_empty(source_->lookup(kDeliverableKeyName));
  }

  double timeout_seconds = LoggerConfig::kDefaultTimeoutSeconds;
  if (overrides.timeout_seconds) {
    timeout_seconds = *overrides.timeout_seconds;
  } else if (auto raw = non_empty(source_->lookup(kTimeoutName))) {
    auto parsed = parse_double(*raw);
    if (!parsed) {
      throw ConfigurationError(std::string(kTimeoutName) + " from " +
                               source_->describe() +
                               " is not a number: " + *raw);
    }
    timeout_seconds = *parsed;
  }

  int max_retries = LoggerConfig::kDefaultMaxRetries;
  if (overrides.max_retries) {
    max_retries = *overrides.max_retries;
  } else if (auto raw = non_empty(source_->lookup(kRetriesName))) {
    auto parsed = parse_int(*raw);
    if (!parsed) {
      throw ConfigurationError(std::string(kRetriesName) + " from " +
                               source_->describe() +
                               " is not an integer: " + *raw);
    }
    max_retries = *parsed;
  }

  bool silent_failures = LoggerConfig::kDefaultSilentFailures;
  if (overrides.silent_failures) {
    silent_failures = *overrides.silent_failures;
  } else if (auto raw = non_empty(source_->lookup(kSilentFailuresName))) {
    auto parsed = parse_bool(*raw);
    if (!parsed) {
      throw ConfigurationError(std::string(kSilentFailuresName) + " from " +
                               source_->describe() +
                               " is not a boolean: " + *raw);
    }
    silent_failures = *parsed;
  }

  try {
    return LoggerConfig::create(project_key.value_or(""),
                                deliverable_key.value_or(""), timeout_seconds,
                                max_retries, silent_failures);
  } catch (const ConfigurationError &e) {
    config_log()->error("{} (source: {})", e.what(), source_->describe());
    throw;
  }
}

} // namespace hgl
