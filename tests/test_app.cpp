#include "app.hpp"
#include "fake_git_backend.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace agsq;
using agsq::test::FakeGitBackend;
using agsq::test::make_commit;

namespace {

FakeGitBackend backend_with_run() {
  FakeGitBackend backend;
  backend.remote_branches = {"main"};
  backend.branches["main"] = {
      make_commit("a1", "Jane", "j@x.io", 100, "ABC-1 start"),
      make_commit("a2", "Jane", "j@x.io", 200, "ABC-1 finish"),
      make_commit("b1", "Bob", "b@x.io", 300, "docs"),
  };
  return backend;
}

} // namespace

TEST_CASE("declining the prompt cancels the run", "[app]") {
  std::istringstream in("n\n");
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char *argv[] = {prog};
  CHECK(app.run(1, argv) == 1);
  CHECK(app.should_exit());
  CHECK(out.str().find("cannot be undone. Continue? [y/N]") !=
        std::string::npos);
}

TEST_CASE("accepting the prompt continues", "[app]") {
  std::istringstream in("y\n");
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char *argv[] = {prog};
  CHECK(app.run(1, argv) == 0);
  CHECK_FALSE(app.should_exit());
}

TEST_CASE("squash run prints review instructions and exports", "[app]") {
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char yes[] = "-y";
  char csv_flag[] = "--export-csv";
  char csv_path[] = "agsq_app.csv";
  char json_flag[] = "--export-json";
  char json_path[] = "agsq_app.json";
  char *argv[] = {prog, yes, csv_flag, csv_path, json_flag, json_path};
  REQUIRE(app.run(6, argv) == 0);
  CHECK(out.str().empty());

  auto backend = backend_with_run();
  CHECK(app.squash(backend) == 0);
  CHECK(backend.hashes("main").size() == 2);
  REQUIRE(app.summary().results.size() == 1);
  CHECK(app.summary().results[0].message == "ABC-1 start\n\nABC-1 finish");
  const std::string text = out.str();
  CHECK(text.find("Done squashing commits (1 squash(es))") !=
        std::string::npos);
  CHECK(text.find("git push --all <new-repo-url>") != std::string::npos);

  std::ifstream csv("agsq_app.csv");
  std::string header;
  std::getline(csv, header);
  CHECK(header == "branch,original_commits,original_author,new_commit,message");
  std::string row;
  std::getline(csv, row);
  CHECK(row.rfind("main,a1 a2,Jane <j@x.io>,", 0) == 0);
  csv.close();
  std::ifstream json("agsq_app.json");
  CHECK(json.good());
  json.close();
  std::remove("agsq_app.csv");
  std::remove("agsq_app.json");
}

TEST_CASE("dry run skips the prompt and leaves history alone", "[app]") {
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char dry[] = "--dry-run";
  char *argv[] = {prog, dry};
  REQUIRE(app.run(2, argv) == 0);
  CHECK(out.str().empty());

  auto backend = backend_with_run();
  CHECK(app.squash(backend) == 0);
  CHECK(backend.collapses.empty());
  CHECK(out.str() == "Dry run complete: 1 group(s) would be squashed.\n");
}

TEST_CASE("config file values are overridden by flags", "[app]") {
  {
    std::ofstream f("agsq_app_cfg.yaml");
    f << "squash:\n"
         "  squash_window: 1h\n"
         "workflow:\n"
         "  assume_yes: true\n"
         "repository:\n"
         "  remote: upstream\n";
  }
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char cfg_flag[] = "--config";
  char cfg_path[] = "agsq_app_cfg.yaml";
  char window_flag[] = "--squash-window";
  char window_val[] = "2h";
  char *argv[] = {prog, cfg_flag, cfg_path, window_flag, window_val};
  REQUIRE(app.run(5, argv) == 0);
  CHECK(app.config().squash_window() == std::chrono::hours{2});
  CHECK(app.config().assume_yes());
  CHECK(app.config().remote() == "upstream");
  std::remove("agsq_app_cfg.yaml");
}

TEST_CASE("invalid configuration exits with an error", "[app]") {
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char cfg_flag[] = "--config";
  char cfg_path[] = "agsq_missing_cfg.toml";
  char *argv[] = {prog, cfg_flag, cfg_path};
  CHECK(app.run(3, argv) == 1);
  CHECK(app.should_exit());
}

TEST_CASE("a failed rewrite fails the run", "[app]") {
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char yes[] = "-y";
  char *argv[] = {prog, yes};
  REQUIRE(app.run(2, argv) == 0);

  auto backend = backend_with_run();
  backend.fail_collapse = true;
  CHECK(app.squash(backend) == 1);
  CHECK(app.summary().aborted);
  CHECK(backend.hashes("main").size() == 3);
  CHECK(out.str().find("Done squashing") == std::string::npos);
}

TEST_CASE("branch listing failure fails the run", "[app]") {
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char yes[] = "-y";
  char *argv[] = {prog, yes};
  REQUIRE(app.run(2, argv) == 0);

  FakeGitBackend backend;
  backend.fail_list_branches = true;
  CHECK(app.squash(backend) == 1);
}
