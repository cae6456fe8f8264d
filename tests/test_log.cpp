#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>

namespace {
std::string read_file(const std::string &path) {
  std::ifstream f(path);
  return std::string((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
}
} // namespace

TEST_CASE("test log") {
  const char *path = "agsq_test.log";
  std::remove(path);
  agsq::init_logger(spdlog::level::info, "", path, 0);
  spdlog::debug("debug message");
  spdlog::info("info message");
  spdlog::default_logger()->flush();
  REQUIRE(std::filesystem::exists(path));
  auto content = read_file(path);
  REQUIRE(content.find("info message") != std::string::npos);
  REQUIRE(content.find("debug message") == std::string::npos);
  agsq::init_logger(spdlog::level::info);
  std::remove(path);
}

TEST_CASE("category loggers share sinks and accept overrides", "[log]") {
  const char *path = "agsq_category.log";
  std::remove(path);
  auto early = agsq::category_logger("grouping");
  agsq::init_logger(spdlog::level::info, "%n %v", path, 0);
  REQUIRE(early->name() == "agsq.grouping");

  agsq::configure_log_categories({{"grouping", spdlog::level::debug}});
  early->debug("grouping detail");
  agsq::category_logger("rewrite")->debug("rewrite detail");
  early->flush();
  agsq::category_logger("rewrite")->flush();

  auto content = read_file(path);
  CHECK(content.find("agsq.grouping grouping detail") != std::string::npos);
  CHECK(content.find("rewrite detail") == std::string::npos);
  agsq::init_logger(spdlog::level::info);
  std::remove(path);
}

TEST_CASE("rotating log files are created", "[log]") {
  const char *path = "agsq_rotating.log";
  std::remove(path);
  agsq::init_logger(spdlog::level::info, "", path, 2, true);
  spdlog::warn("rotating message");
  auto content = read_file(path);
  CHECK(content.find("rotating message") != std::string::npos);
  agsq::init_logger(spdlog::level::info);
  std::remove(path);
}
