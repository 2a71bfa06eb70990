#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLoggerName = "huntglitch";
constexpr std::size_t kMaxLogFileBytes = 1024 * 1024 * 5;
constexpr std::size_t kQueueSize = 8192;

/// Client loggers, all writing through one distributing sink.
struct LogState {
  std::mutex mutex;
  std::shared_ptr<spdlog::details::thread_pool> pool;
  std::shared_ptr<spdlog::sinks::dist_sink_mt> sink;
  std::shared_ptr<spdlog::logger> root;
  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> categories;
  spdlog::level::level_enum level{spdlog::level::warn};
};

LogState &state() {
  static LogState s;
  return s;
}

std::shared_ptr<spdlog::logger> make_logger(LogState &s,
                                            const std::string &name) {
  if (!s.pool) {
    s.pool = std::make_shared<spdlog::details::thread_pool>(kQueueSize, 1);
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      name, s.sink, s.pool, spdlog::async_overflow_policy::block);
  logger->set_level(s.level);
  return logger;
}

// Caller holds s.mutex.
std::shared_ptr<spdlog::logger> root_locked(LogState &s) {
  if (!s.root) {
    s.sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
    s.sink->add_sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    s.root = make_logger(s, kRootLoggerName);
  }
  return s.root;
}
} // namespace

namespace hgl {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files) {
  auto &s = state();
  std::unique_lock<std::mutex> lock(s.mutex);
  auto root = root_locked(s);
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!file.empty()) {
    if (rotate_files > 0) {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          file, kMaxLogFileBytes, rotate_files));
    } else {
      sinks.push_back(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
    }
  }
  s.sink->set_sinks(std::move(sinks));
  if (!pattern.empty()) {
    s.sink->set_pattern(pattern);
  }
  s.level = level;
  root->set_level(level);
  for (auto &entry : s.categories) {
    entry.second->set_level(level);
  }
  lock.unlock();
  root->debug("Logger initialised (level={}, file='{}', rotate={})",
              spdlog::level::to_string_view(level), file, rotate_files);
}

std::shared_ptr<spdlog::logger> root_logger() {
  auto &s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  return root_locked(s);
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  auto &s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  root_locked(s);
  auto it = s.categories.find(category);
  if (it != s.categories.end()) {
    return it->second;
  }
  auto logger =
      make_logger(s, std::string(kRootLoggerName) + "." + category);
  s.categories.emplace(category, logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
  category_logger("logging")->debug("Applied {} log category override(s)",
                                    overrides.size());
}

void install_default_logger() { spdlog::set_default_logger(root_logger()); }

void shutdown_logging() {
  auto &s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (!s.pool) {
    return;
  }
  if (s.root) {
    s.root->flush();
  }
  for (auto &entry : s.categories) {
    entry.second->flush();
  }
  // Destroying the pool processes the queued flushes and joins the worker.
  s.pool.reset();
}

} // namespace hgl
