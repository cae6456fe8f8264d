/**
 * @file branch_driver.cpp
 * @brief Implements branch filtering and the per-branch squash pipeline.
 */
#include "branch_driver.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "history_reader.hpp"
#include "history_rewriter.hpp"
#include "log.hpp"
#include "squash_history.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

namespace agsq {

namespace {

std::shared_ptr<spdlog::logger> driver_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("driver");
  }();
  return logger;
}

/// A collapsed group and the history index of its first original member.
struct PlacedResult {
  std::size_t position;
  SquashResult result;
};

/**
 * Point every result at the commit that now stands for its group.
 *
 * Collapsing an older group replays newer ones under new hashes, so the id
 * returned by each collapse is only final for the oldest group. The branch
 * is re-read and each group is located by its first-parent position.
 *
 * @param placed Results ordered oldest group first.
 * @param original_size Length of the history before any collapse.
 * @param failure Receives the reason when the ids cannot be confirmed.
 */
bool settle_new_commits(GitBackend &backend, const std::string &branch,
                        std::size_t original_size,
                        std::vector<PlacedResult> &placed,
                        std::string &failure) {
  std::vector<CommitRecord> rewritten;
  try {
    rewritten = backend.list_commits(branch);
  } catch (const BackendError &e) {
    failure = std::string("cannot re-read rewritten history: ") + e.what();
    return false;
  }
  std::size_t removed = 0;
  for (const auto &p : placed) {
    removed += p.result.original_commits.size() - 1;
  }
  if (rewritten.size() + removed != original_size) {
    failure = "rewritten history has " + std::to_string(rewritten.size()) +
              " commit(s), expected " +
              std::to_string(original_size - removed);
    return false;
  }
  removed = 0;
  for (auto &p : placed) {
    p.result.new_commit = rewritten[p.position - removed].hash;
    removed += p.result.original_commits.size() - 1;
  }
  return true;
}

/**
 * Convert a shell-style glob pattern to a regular expression.
 *
 * @param glob Glob expression containing '*' and '?' wildcards.
 * @return std::regex equivalent capturing the same matching semantics.
 */
std::regex glob_to_regex(const std::string &glob) {
  std::string rx = "^";
  for (char c : glob) {
    switch (c) {
    case '*':
      rx += ".*";
      break;
    case '?':
      rx += '.';
      break;
    case '.':
    case '+':
    case '(':
    case ')':
    case '{':
    case '}':
    case '^':
    case '$':
    case '|':
    case '\\':
    case '[':
    case ']':
      rx += '\\';
      rx += c;
      break;
    default:
      rx += c;
    }
  }
  rx += '$';
  return std::regex(rx);
}

std::vector<std::regex> compile_patterns(const std::vector<std::string> &in) {
  std::vector<std::regex> out;
  out.reserve(in.size());
  for (const auto &pattern : in) {
    if (pattern.rfind("regex:", 0) == 0) {
      try {
        out.emplace_back(pattern.substr(6));
      } catch (const std::regex_error &e) {
        throw ConfigError("Invalid branch pattern '" + pattern +
                          "': " + e.what());
      }
    } else {
      out.push_back(glob_to_regex(pattern));
    }
  }
  return out;
}

bool matches_any(const std::vector<std::regex> &patterns,
                 const std::string &name) {
  return std::any_of(patterns.begin(), patterns.end(),
                     [&name](const std::regex &rx) {
                       return std::regex_match(name, rx);
                     });
}

std::string hash_list(const std::vector<std::string> &hashes) {
  std::string out = "[";
  for (std::size_t i = 0; i < hashes.size(); ++i) {
    if (i) {
      out += ", ";
    }
    out += hashes[i];
  }
  out += ']';
  return out;
}

std::int64_t system_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

BranchFilter::BranchFilter(const std::vector<std::string> &include,
                           const std::vector<std::string> &exclude)
    : include_(compile_patterns(include)), exclude_(compile_patterns(exclude)) {}

bool BranchFilter::allows(const std::string &branch) const {
  if (matches_any(exclude_, branch)) {
    return false;
  }
  return include_.empty() || matches_any(include_, branch);
}

std::size_t RunSummary::count(BranchStatus status) const {
  return static_cast<std::size_t>(std::count_if(
      branches.begin(), branches.end(),
      [status](const BranchReport &r) { return r.status == status; }));
}

bool RunSummary::success() const {
  return !aborted && count(BranchStatus::kAborted) == 0;
}

BranchDriver::BranchDriver(GitBackend &backend, const Config &config,
                           SquashHistory *history, Clock clock)
    : backend_(backend), config_(config), history_(history),
      clock_(clock ? std::move(clock) : Clock(system_now)),
      resolver_(config.aliases()), engine_(config) {}

RunSummary BranchDriver::run() {
  RunSummary summary;
  BranchFilter filter(config_.include_branches(), config_.exclude_branches());
  auto branches = backend_.list_remote_branches();
  driver_log()->info("Found {} remote branch(es)", branches.size());

  for (const auto &branch : branches) {
    if (!filter.allows(branch)) {
      driver_log()->debug("Branch {} filtered out", branch);
      BranchReport report;
      report.branch = branch;
      report.status = BranchStatus::kFiltered;
      summary.branches.push_back(std::move(report));
      continue;
    }
    summary.branches.push_back(process_branch(branch, summary));
    if (summary.aborted) {
      driver_log()->error("Run aborted on branch {}: {}", branch,
                          summary.abort_reason);
      break;
    }
  }
  return summary;
}

BranchReport BranchDriver::process_branch(const std::string &branch,
                                          RunSummary &summary) {
  BranchReport report;
  report.branch = branch;

  try {
    backend_.checkout(branch);
  } catch (const BackendError &e) {
    driver_log()->warn("Skipping branch {}: checkout failed: {}", branch,
                       e.what());
    report.status = BranchStatus::kSkipped;
    report.reason = e.what();
    return report;
  }

  std::vector<Commit> commits;
  GroupingResult grouping;
  try {
    HistoryReader reader(backend_, resolver_);
    commits = reader.read(branch);
    grouping = engine_.group(commits, clock_());
  } catch (const BackendError &e) {
    driver_log()->error("Aborting branch {}: {}", branch, e.what());
    report.status = BranchStatus::kAborted;
    report.reason = e.what();
    return report;
  } catch (const MalformedCommitRecord &e) {
    driver_log()->error("Aborting branch {}: malformed commit record: {}",
                        branch, e.what());
    report.status = BranchStatus::kAborted;
    report.reason = e.what();
    return report;
  }
  report.groups = grouping.groups.size();

  if (config_.dry_run()) {
    for (const auto &group : grouping.groups) {
      if (!group.rewritable()) {
        continue;
      }
      std::vector<std::string> hashes;
      for (const auto &commit : group.commits) {
        hashes.push_back(commit.hash);
      }
      driver_log()->info("[{}] would squash {} by {}", branch,
                         hash_list(hashes), group.last().canonical_author);
      ++report.squashed;
      ++summary.planned;
    }
    return report;
  }

  std::unordered_map<std::string, std::size_t> position;
  for (std::size_t i = 0; i < commits.size(); ++i) {
    position.emplace(commits[i].hash, i);
  }

  HistoryRewriter rewriter(backend_);
  std::vector<PlacedResult> placed;
  for (auto it = grouping.groups.rbegin(); it != grouping.groups.rend();
       ++it) {
    if (!it->rewritable()) {
      continue;
    }
    try {
      SquashResult result = rewriter.rewrite(*it);
      result.branch = branch;
      placed.push_back({position.at(it->first().hash), std::move(result)});
      ++report.squashed;
    } catch (const RewriteError &e) {
      summary.aborted = true;
      summary.rolled_back = e.rolled_back();
      summary.abort_reason = e.what();
      report.status = BranchStatus::kAborted;
      report.reason = e.what();
      break;
    }
  }
  if (placed.empty()) {
    return report;
  }

  std::reverse(placed.begin(), placed.end());
  std::string failure;
  if (!settle_new_commits(backend_, branch, commits.size(), placed, failure)) {
    driver_log()->error("Branch {}: {}", branch, failure);
    if (report.status == BranchStatus::kProcessed) {
      report.status = BranchStatus::kAborted;
      report.reason = failure;
    }
  }
  for (auto &p : placed) {
    driver_log()->info("Commits {} were squashed into:\n{}: {}",
                       hash_list(p.result.original_commits),
                       p.result.new_commit, p.result.message);
    if (history_) {
      history_->record(p.result);
    }
    summary.results.push_back(std::move(p.result));
  }
  return report;
}

} // namespace agsq
