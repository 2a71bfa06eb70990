#include "config.hpp"
#include "errors.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace hgl;

namespace {

std::string write_file(const std::string &name, const std::string &content) {
  std::filesystem::path path = std::filesystem::temp_directory_path() / name;
  std::ofstream f(path.string());
  f << content;
  return path.string();
}

} // namespace

TEST_CASE("test config loading") {
  {
    std::string path = write_file("hgl_cfg.yaml", "huntglitch:\n"
                                                  "  project_key: yproj\n"
                                                  "  deliverable_key: ydeliv\n"
                                                  "network:\n"
                                                  "  timeout: 4\n"
                                                  "  retries: 1\n"
                                                  "silent_failures: true\n");
    auto src = std::make_shared<FileConfigSource>(FileConfigSource::from_file(path));
    LoggerConfig cfg = ConfigResolver(src).resolve();
    REQUIRE(cfg.project_key() == "yproj");
    REQUIRE(cfg.deliverable_key() == "ydeliv");
    REQUIRE(cfg.timeout_seconds() == 4.0);
    REQUIRE(cfg.max_retries() == 1);
    REQUIRE(cfg.silent_failures());
    REQUIRE(src->describe() == path);
    std::filesystem::remove(path);
  }
  {
    std::string path = write_file(
        "hgl_cfg.json",
        R"({"credentials": {"project_key": "jproj", "deliverable_key": "jdeliv"},
            "timeout_seconds": 1.5, "max_retries": 0})");
    auto src = std::make_shared<FileConfigSource>(FileConfigSource::from_file(path));
    LoggerConfig cfg = ConfigResolver(src).resolve();
    REQUIRE(cfg.project_key() == "jproj");
    REQUIRE(cfg.deliverable_key() == "jdeliv");
    REQUIRE(cfg.timeout_seconds() == 1.5);
    REQUIRE(cfg.max_retries() == 0);
    REQUIRE_FALSE(cfg.silent_failures());
    std::filesystem::remove(path);
  }
  {
    std::string path = write_file("hgl_cfg.toml", "project_key = \"tproj\"\n"
                                                  "deliverable_key = \"tdeliv\"\n"
                                                  "[network]\n"
                                                  "retries = 6\n"
                                                  "silent_failures = false\n");
    auto src = std::make_shared<FileConfigSource>(FileConfigSource::from_file(path));
    LoggerConfig cfg = ConfigResolver(src).resolve();
    REQUIRE(cfg.project_key() == "tproj");
    REQUIRE(cfg.deliverable_key() == "tdeliv");
    REQUIRE(cfg.timeout_seconds() == 10.0);
    REQUIRE(cfg.max_retries() == 6);
    REQUIRE_FALSE(cfg.silent_failures());
    std::filesystem::remove(path);
  }
}

TEST_CASE("config file errors") {
  REQUIRE_THROWS_AS(FileConfigSource::from_file("/nonexistent/hgl.yaml"),
                    ConfigurationError);

  std::string ini = write_file("hgl_cfg.ini", "project_key=x\n");
  REQUIRE_THROWS_AS(FileConfigSource::from_file(ini), ConfigurationError);
  std::filesystem::remove(ini);

  std::string broken = write_file("hgl_broken.json", "{not json");
  REQUIRE_THROWS_AS(FileConfigSource::from_file(broken), ConfigurationError);
  std::filesystem::remove(broken);

  std::string nested = write_file("hgl_nested.json",
                                  R"({"project_key": {"a": 1}})");
  REQUIRE_THROWS_AS(FileConfigSource::from_file(nested), ConfigurationError);
  std::filesystem::remove(nested);
}

TEST_CASE("config file behind environment") {
  std::string path = write_file("hgl_chain.yaml", "project_key: fileproj\n"
                                                  "deliverable_key: filedeliv\n"
                                                  "retries: 2\n");
  auto env = std::make_shared<MapConfigSource>();
  env->set(kProjectKeyName, "envproj");
  auto file =
      std::make_shared<FileConfigSource>(FileConfigSource::from_file(path));
  auto chained = std::make_shared<ChainedConfigSource>(
      std::vector<std::shared_ptr<const ConfigSource>>{env, file});
  LoggerConfig cfg = ConfigResolver(chained).resolve();
  REQUIRE(cfg.project_key() == "envproj");
  REQUIRE(cfg.deliverable_key() == "filedeliv");
  REQUIRE(cfg.max_retries() == 2);
  std::filesystem::remove(path);
}
