#include "branch_driver.hpp"
#include "command_runner.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "git_cli_backend.hpp"
#include "squash_history.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

using namespace agsq;
namespace fs = std::filesystem;

namespace {

fs::path mkd(const std::string &name) {
  auto d = fs::temp_directory_path() / ("agsq_git_" + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

void sh(const std::string &cmd, const fs::path &wd) {
  auto full = "cd \"" + wd.string() + "\" && " + cmd + " >/dev/null 2>&1";
  REQUIRE(std::system(full.c_str()) == 0);
}

std::string git_out(const fs::path &wd, const std::vector<std::string> &args) {
  ProcessRunner runner;
  CommandSpec spec;
  spec.args = {"git"};
  spec.args.insert(spec.args.end(), args.begin(), args.end());
  spec.cwd = wd.string();
  auto result = runner.run(spec);
  REQUIRE(result.exit_code == 0);
  while (!result.out.empty() && result.out.back() == '\n') {
    result.out.pop_back();
  }
  return result.out;
}

void commit_file(const fs::path &repo, const std::string &file,
                 const std::string &content, const std::string &message,
                 long long when, const std::string &author = "Jane Doe",
                 const std::string &email = "jane@y.com") {
  std::ofstream(repo / file) << content;
  const std::string date = std::to_string(when) + " +0000";
  sh("git add " + file + " && GIT_AUTHOR_NAME=\"" + author +
         "\" GIT_AUTHOR_EMAIL=" + email + " GIT_AUTHOR_DATE=\"" + date +
         "\" GIT_COMMITTER_DATE=\"" + date + "\" git commit -q -m \"" +
         message + "\"",
     repo);
}

std::vector<std::string> lines_of(const std::string &text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) {
      out.push_back(line);
    }
  }
  return out;
}

bool on_branch(const fs::path &work, const std::string &branch,
               const std::string &hash) {
  auto history = lines_of(git_out(work, {"rev-list", branch}));
  return std::find(history.begin(), history.end(), hash) != history.end();
}

/// Upstream on `main` filled by @p populate, cloned to `work`.
fs::path clone_of(const std::string &name,
                  const std::function<void(const fs::path &)> &populate) {
  auto root = mkd(name);
  auto upstream = root / "upstream";
  fs::create_directories(upstream);
  sh("git init -q && git checkout -q -b main", upstream);
  sh("git config user.email test@example.com && git config user.name tester",
     upstream);
  populate(upstream);

  auto work = root / "work";
  sh("git clone -q \"" + upstream.string() + "\" \"" + work.string() + "\"",
     root);
  sh("git config user.email test@example.com && git config user.name tester",
     work);
  return work;
}

/// Upstream with main (4 commits) and feature (1 extra), cloned to `work`.
fs::path make_clone(const std::string &name) {
  return clone_of(name, [](const fs::path &upstream) {
    commit_file(upstream, "a.txt", "1", "first", 1700000000);
    commit_file(upstream, "a.txt", "2", "ABC-1 second", 1700000100);
    commit_file(upstream, "b.txt", "3", "ABC-1 third", 1700000200);
    commit_file(upstream, "a.txt", "4", "fourth", 1700000300, "Bob",
                "bob@b.io");
    sh("git tag v0 HEAD~3", upstream);
    sh("git checkout -q -b feature", upstream);
    commit_file(upstream, "c.txt", "5", "feature work", 1700000400);
    sh("git checkout -q main", upstream);
  });
}

/**
 * main: base, step one, step two, step three, "Merge side". The side branch
 * forks from step two and adds s.txt. Every step rewrites a.txt, which base
 * does not have.
 */
void populate_forked(const fs::path &upstream) {
  commit_file(upstream, "base.txt", "0", "base", 1700000000, "Bob",
              "bob@b.io");
  commit_file(upstream, "a.txt", "1", "step one", 1700000100);
  commit_file(upstream, "a.txt", "2", "step two", 1700000200);
  sh("git checkout -q -b side", upstream);
  commit_file(upstream, "s.txt", "s", "side work", 1700000250, "Bob",
              "bob@b.io");
  sh("git checkout -q main", upstream);
  commit_file(upstream, "a.txt", "3", "step three", 1700000300);
  sh("GIT_AUTHOR_DATE=\"1700000400 +0000\" "
     "GIT_COMMITTER_DATE=\"1700000400 +0000\" "
     "git merge -q --no-ff side -m \"Merge side\"",
     upstream);
}

std::string read_file(const fs::path &path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

BranchDriver::Clock clock_at(std::int64_t now) {
  return [now] { return now; };
}

GitCliBackend backend_for(const fs::path &work) {
  GitCliOptions options;
  options.repository_path = work.string();
  return GitCliBackend(options);
}

} // namespace

TEST_CASE("remote branches are listed without HEAD", "[git]") {
  auto work = make_clone("branches");
  auto backend = backend_for(work);
  auto branches = backend.list_remote_branches();
  std::sort(branches.begin(), branches.end());
  CHECK(branches == std::vector<std::string>{"feature", "main"});
}

TEST_CASE("checkout creates a tracking branch when needed", "[git]") {
  auto work = make_clone("checkout");
  auto backend = backend_for(work);
  backend.checkout("feature");
  CHECK(git_out(work, {"rev-parse", "--abbrev-ref", "HEAD"}) == "feature");
  backend.checkout("main");
  CHECK(git_out(work, {"rev-parse", "--abbrev-ref", "HEAD"}) == "main");
  CHECK_THROWS_AS(backend.checkout("missing"), BackendCommandFailure);
}

TEST_CASE("commit records are listed oldest first", "[git]") {
  auto work = make_clone("records");
  auto backend = backend_for(work);
  backend.checkout("main");
  auto records = backend.list_commits("main");
  REQUIRE(records.size() == 4);
  CHECK(records[0].commit_time == 1700000000);
  CHECK(records[0].parents.empty());
  CHECK(records[1].parents == std::vector<std::string>{records[0].hash});
  CHECK(records[1].author_name == "Jane Doe");
  CHECK(records[1].author_email == "jane@y.com");
  CHECK(records[3].author_name == "Bob");
  CHECK(backend.message(records[1].hash) == "ABC-1 second");
  CHECK(backend.tags_containing(records[0].hash) ==
        std::vector<std::string>{"v0"});
  CHECK(backend.tags_containing(records[3].hash).empty());
  CHECK(backend.head() == records[3].hash);
}

TEST_CASE("collapsing a range keeps content and order", "[git]") {
  auto work = make_clone("collapse");
  auto backend = backend_for(work);
  backend.checkout("main");
  auto before = backend.list_commits("main");
  const std::string final_tree = git_out(work, {"rev-parse", "HEAD^{tree}"});
  const std::string last_tree =
      git_out(work, {"rev-parse", before[2].hash + "^{tree}"});

  auto collapsed = backend.collapse_range(before[1].hash, before[2].hash,
                                          "ABC-1 second\n\nABC-1 third");
  CHECK(git_out(work, {"rev-parse", collapsed + "^{tree}"}) == last_tree);
  CHECK(git_out(work, {"rev-parse", "HEAD^{tree}"}) == final_tree);

  auto after = backend.list_commits("main");
  REQUIRE(after.size() == 3);
  CHECK(after[0].hash == before[0].hash);
  CHECK(after[1].hash == collapsed);
  CHECK(after[1].parents == std::vector<std::string>{before[0].hash});
  CHECK(after[1].author_name == "Jane Doe");
  CHECK(after[2].author_name == "Bob");
  CHECK(backend.message(collapsed) == "ABC-1 second\n\nABC-1 third");
  CHECK(backend.message(after[2].hash) == "fourth");
}

TEST_CASE("collapsing up to HEAD moves the branch", "[git]") {
  auto work = make_clone("collapse_head");
  auto backend = backend_for(work);
  backend.checkout("feature");
  auto before = backend.list_commits("feature");
  REQUIRE(before.size() == 5);
  auto collapsed =
      backend.collapse_range(before[3].hash, before[4].hash, "combined");
  CHECK(backend.head() == collapsed);
  CHECK(backend.list_commits("feature").size() == 4);
}

TEST_CASE("failed collapse leaves the branch untouched", "[git]") {
  auto work = make_clone("collapse_fail");
  auto backend = backend_for(work);
  backend.checkout("main");
  const std::string head = backend.head();
  CHECK_THROWS_AS(backend.collapse_range("0123456789abcdef", head, "msg"),
                  BackendError);
  CHECK(backend.head() == head);
}

TEST_CASE("a rebase that stops midway is fully undone", "[git]") {
  auto work = clone_of("collapse_midway", populate_forked);
  auto backend = backend_for(work);
  backend.checkout("main");
  auto records = backend.list_commits("main");
  REQUIRE(records.size() == 5);
  const std::string head = backend.head();

  // Folding the fork point away makes the merge conflict on replay.
  CHECK_THROWS_AS(
      backend.collapse_range(records[1].hash, records[3].hash, "steps"),
      BackendError);
  CHECK(backend.head() == head);
  CHECK(git_out(work, {"rev-parse", "--abbrev-ref", "HEAD"}) == "main");
  CHECK(git_out(work, {"status", "--porcelain"}).empty());
  CHECK_FALSE(fs::exists(work / ".git" / "rebase-merge"));
  CHECK_FALSE(fs::exists(work / ".git" / "rebase-apply"));
  CHECK(read_file(work / "a.txt") == "3");
  CHECK(fs::exists(work / "s.txt"));
}

TEST_CASE("fork points are reported with the history", "[git]") {
  auto work = clone_of("fork_points", populate_forked);
  auto backend = backend_for(work);
  backend.checkout("main");
  auto records = backend.list_commits("main");
  REQUIRE(records.size() == 5);
  CHECK_FALSE(records[0].has_side_children);
  CHECK_FALSE(records[1].has_side_children);
  CHECK(records[2].has_side_children);
  CHECK_FALSE(records[3].has_side_children);
  CHECK_FALSE(records[4].has_side_children);
  CHECK(records[4].parents.size() == 2);
}

TEST_CASE("driver leaves merged side history intact", "[git][driver]") {
  auto work = clone_of("driver_fork", populate_forked);
  auto backend = backend_for(work);
  const std::string tree = git_out(work, {"rev-parse", "origin/main^{tree}"});
  Config cfg;
  cfg.set_include_branches({"main"});
  BranchDriver driver(backend, cfg, nullptr, clock_at(1700000500));

  auto summary = driver.run();
  CHECK(summary.success());
  REQUIRE(summary.results.size() == 1);
  const auto &result = summary.results[0];
  CHECK(result.message == "step one\n\nstep two");
  CHECK(on_branch(work, "main", result.new_commit));
  CHECK(backend.message(result.new_commit) == "step one\n\nstep two");
  CHECK(git_out(work, {"rev-parse", "HEAD^{tree}"}) == tree);

  auto after = backend.list_commits("main");
  REQUIRE(after.size() == 4);
  CHECK(after[1].hash == result.new_commit);
  CHECK(after[3].parents.size() == 2);
  CHECK(backend.message(after[3].hash) == "Merge side");
}

TEST_CASE("every reported squash is on the rewritten branch",
          "[git][driver]") {
  auto work = clone_of("driver_ids", [](const fs::path &upstream) {
    commit_file(upstream, "a.txt", "1", "one", 1700000000);
    commit_file(upstream, "a.txt", "2", "two", 1700000100);
    commit_file(upstream, "b.txt", "3", "bob", 1700000200, "Bob", "bob@b.io");
    commit_file(upstream, "a.txt", "4", "three", 1700000300);
    commit_file(upstream, "a.txt", "5", "four", 1700000400);
  });
  auto backend = backend_for(work);
  Config cfg;
  SquashHistory history(":memory:");
  BranchDriver driver(backend, cfg, &history, clock_at(1700000500));

  auto summary = driver.run();
  CHECK(summary.success());
  REQUIRE(summary.results.size() == 2);
  CHECK(summary.results[0].message == "one\n\ntwo");
  CHECK(summary.results[1].message == "three\n\nfour");
  for (const auto &result : summary.results) {
    CHECK(on_branch(work, "main", result.new_commit));
    CHECK(backend.message(result.new_commit) == result.message);
  }

  auto recorded = history.results();
  REQUIRE(recorded.size() == 2);
  CHECK(recorded[0].new_commit == summary.results[0].new_commit);
  CHECK(recorded[1].new_commit == summary.results[1].new_commit);
  CHECK(lines_of(git_out(work, {"rev-list", "main"})).size() == 3);
}

TEST_CASE("side children are told apart from the next commit", "[git]") {
  std::vector<CommitRecord> records(4);
  records[0].hash = "a";
  records[1].hash = "b";
  records[2].hash = "c";
  records[3].hash = "m";
  GitCliBackend::mark_side_children(records, "m\n"
                                             "s m\n"
                                             "c m\n"
                                             "b c s\n"
                                             "a b\n");
  CHECK_FALSE(records[0].has_side_children);
  CHECK(records[1].has_side_children);
  CHECK_FALSE(records[2].has_side_children);
  CHECK_FALSE(records[3].has_side_children);
}

TEST_CASE("log records are parsed strictly", "[git]") {
  const std::string ok = "abc\x1fJane\x1fj@y.com\x1f"
                         "100\x1fp1 p2\x1e\n"
                         "def\x1f\x1fonly@mail.io\x1f"
                         "200\x1f\x1e\n";
  auto records = GitCliBackend::parse_log_records(ok);
  REQUIRE(records.size() == 2);
  CHECK(records[0].parents == std::vector<std::string>{"p1", "p2"});
  CHECK(records[1].author_name.empty());
  CHECK(records[1].commit_time == 200);
  CHECK(records[1].parents.empty());

  CHECK(GitCliBackend::parse_log_records("").empty());
  CHECK_THROWS_AS(GitCliBackend::parse_log_records("abc\x1fJane\x1e"),
                  MalformedCommitRecord);
  CHECK_THROWS_AS(GitCliBackend::parse_log_records(
                      "abc\x1f\x1f\x1f"
                      "100\x1f\x1e"),
                  MalformedCommitRecord);
  CHECK_THROWS_AS(GitCliBackend::parse_log_records(
                      "abc\x1fJane\x1fj@y.com\x1fsoon\x1f\x1e"),
                  MalformedCommitRecord);
}
