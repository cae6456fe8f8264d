#include "config.hpp"
#include "errors.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace agsq;
using namespace std::chrono;

TEST_CASE("defaults match the documented behaviour", "[config]") {
  Config cfg;
  CHECK(cfg.squash_window() == seconds{1209600});
  CHECK(cfg.age_limit() == seconds{1209600});
  CHECK_FALSE(cfg.enable_age_filter());
  CHECK(cfg.boundary_keywords() ==
        std::vector<std::string>{"revert", "merge", "pull"});
  CHECK(cfg.treat_merge_commits_as_boundaries());
  CHECK(cfg.correlation_pattern() == kDefaultCorrelationPattern);
  CHECK(cfg.aliases().empty());
  CHECK(cfg.repository_path() == ".");
  CHECK(cfg.remote() == "origin");
  CHECK(cfg.git_executable() == "git");
  CHECK(cfg.git_timeout() == seconds{30});
  CHECK(cfg.history_db() == ":memory:");
  CHECK(cfg.log_rotate() == 3);
  CHECK_FALSE(cfg.dry_run());
}

TEST_CASE("yaml config with sections", "[config]") {
  {
    std::ofstream f("agsq_cfg.yaml");
    f << "squash:\n"
         "  squash_window: 6h\n"
         "  age_limit: 86400\n"
         "  enable_age_filter: true\n"
         "  boundary_keywords: [revert, hotfix]\n"
         "identity:\n"
         "  aliases:\n"
         "    - canonical: Jane Doe\n"
         "      identifiers: [jdoe@x.com, \"Jane Doe <jane@y.com>\"]\n"
         "repository:\n"
         "  remote: upstream\n"
         "  git_timeout: 2m\n"
         "  exclude_branches: [\"wip/*\"]\n"
         "logging:\n"
         "  log_level: debug\n"
         "  log_categories:\n"
         "    git: trace\n";
  }
  Config cfg = Config::from_file("agsq_cfg.yaml");
  CHECK(cfg.squash_window() == hours{6});
  CHECK(cfg.age_limit() == seconds{86400});
  CHECK(cfg.enable_age_filter());
  CHECK(cfg.boundary_keywords() ==
        std::vector<std::string>{"revert", "hotfix"});
  REQUIRE(cfg.aliases().find("JDOE@x.com") != nullptr);
  CHECK(*cfg.aliases().find("jane doe <jane@y.com>") == "Jane Doe");
  CHECK(cfg.remote() == "upstream");
  CHECK(cfg.git_timeout() == minutes{2});
  CHECK(cfg.exclude_branches() == std::vector<std::string>{"wip/*"});
  CHECK(cfg.log_level() == "debug");
  CHECK(cfg.log_categories().at("git") == "trace");
  std::remove("agsq_cfg.yaml");
}

TEST_CASE("toml config", "[config]") {
  {
    std::ofstream f("agsq_cfg.toml");
    f << "[squash]\n"
         "squash_window = 3600\n"
         "treat_merge_commits_as_boundaries = false\n"
         "correlation_pattern = '#\\d+'\n"
         "[identity.aliases]\n"
         "\"Jane Doe\" = [\"jdoe@x.com\"]\n"
         "[artifacts]\n"
         "history_db = \"squashes.db\"\n"
         "export_json = \"squashes.json\"\n";
  }
  Config cfg = Config::from_file("agsq_cfg.toml");
  CHECK(cfg.squash_window() == seconds{3600});
  CHECK_FALSE(cfg.treat_merge_commits_as_boundaries());
  CHECK(cfg.correlation_pattern() == "#\\d+");
  REQUIRE(cfg.aliases().find("jdoe@x.com") != nullptr);
  CHECK(*cfg.aliases().find("jdoe@x.com") == "Jane Doe");
  CHECK(cfg.history_db() == "squashes.db");
  CHECK(cfg.export_json() == "squashes.json");
  std::remove("agsq_cfg.toml");
}

TEST_CASE("json config", "[config]") {
  {
    std::ofstream f("agsq_cfg.json");
    f << R"({"workflow": {"dry_run": true, "assume_yes": true},
             "include_branches": ["main", "release/*"],
             "log_rotate": 0})";
  }
  Config cfg = Config::from_file("agsq_cfg.json");
  CHECK(cfg.dry_run());
  CHECK(cfg.assume_yes());
  CHECK(cfg.include_branches() ==
        std::vector<std::string>{"main", "release/*"});
  CHECK(cfg.log_rotate() == 0);
  std::remove("agsq_cfg.json");
}

TEST_CASE("invalid configuration raises ConfigError", "[config]") {
  using nlohmann::json;
  CHECK_THROWS_AS(Config::from_json(json{{"squash_window", -1}}), ConfigError);
  CHECK_THROWS_AS(Config::from_json(json{{"squash_window", "soon"}}),
                  ConfigError);
  CHECK_THROWS_AS(Config::from_json(json{{"correlation_pattern", "("}}),
                  ConfigError);
  CHECK_THROWS_AS(Config::from_json(json{{"enable_age_filter", "maybe"}}),
                  ConfigError);
  CHECK_THROWS_AS(Config::from_json(json{{"git_timeout", 0}}), ConfigError);
  CHECK_THROWS_AS(
      Config::from_json(json{{"aliases", json{{"A", json::array({"x@y"})},
                                              {"B", json::array({"X@Y"})}}}}),
      ConfigError);
  CHECK_THROWS_AS(Config::from_json(json{{"aliases", 5}}), ConfigError);
  CHECK_THROWS_AS(Config::from_json(json::array()), ConfigError);
  CHECK_THROWS_AS(Config::from_file("agsq_cfg.ini"), ConfigError);
  CHECK_THROWS_AS(Config::from_file("agsq_missing.json"), ConfigError);

  {
    std::ofstream f("agsq_broken.json");
    f << "{ not json";
  }
  CHECK_THROWS_AS(Config::from_file("agsq_broken.json"), ConfigError);
  std::remove("agsq_broken.json");
}
