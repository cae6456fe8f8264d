/**
 * @file branch_driver.hpp
 * @brief Runs the read, group and rewrite pipeline over every branch.
 */

#ifndef AUTOGITSQUASH_BRANCH_DRIVER_HPP
#define AUTOGITSQUASH_BRANCH_DRIVER_HPP

#include "commit.hpp"
#include "git_backend.hpp"
#include "grouping_engine.hpp"
#include "identity_resolver.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <regex>
#include <string>
#include <vector>

namespace agsq {

class Config;
class SquashHistory;

/**
 * Include/exclude filter over branch names.
 *
 * Patterns are shell globs (`*`, `?`) unless prefixed with `regex:`. An empty
 * include list admits every branch; exclusions always win.
 */
class BranchFilter {
public:
  BranchFilter(const std::vector<std::string> &include,
               const std::vector<std::string> &exclude);

  bool allows(const std::string &branch) const;

private:
  std::vector<std::regex> include_;
  std::vector<std::regex> exclude_;
};

/// What happened to one branch during a run.
enum class BranchStatus {
  kProcessed, ///< Read, grouped and (unless dry run) rewritten
  kFiltered,  ///< Excluded by the branch filter
  kSkipped,   ///< Checkout failed
  kAborted    ///< Reading, rewriting or confirming the rewrite failed
};

struct BranchReport {
  std::string branch;
  BranchStatus status{BranchStatus::kProcessed};
  std::size_t groups{0};   ///< Groups emitted by the grouping engine
  std::size_t squashed{0}; ///< Groups collapsed (or planned in dry run)
  std::string reason;      ///< Failure description for skipped or aborted
};

/// Outcome of a whole run.
struct RunSummary {
  std::vector<BranchReport> branches;
  std::vector<SquashResult> results; ///< Per branch, oldest group first
  std::size_t planned{0};            ///< Groups reported in dry run mode
  bool aborted{false};               ///< A rewrite failed and stopped the run
  bool rolled_back{true};            ///< Rollback outcome of that failure
  std::string abort_reason;

  std::size_t count(BranchStatus status) const;

  /// True when no branch was aborted and the run was not stopped.
  bool success() const;
};

/**
 * Drives one run: lists remote branches, then checks out, reads, groups and
 * rewrites each of them in turn.
 *
 * Within a branch, groups are collapsed newest first so the hashes of older
 * groups stay valid. The branch is then re-read so every result names the
 * commit that is on the branch at the end; results are logged, recorded and
 * reported oldest first.
 */
class BranchDriver {
public:
  using Clock = std::function<std::int64_t()>;

  /**
   * @param backend Repository backend, borrowed for the run.
   * @param config Settings, borrowed for the run.
   * @param history Optional ledger receiving every successful squash.
   * @param clock Source of "now" in seconds since epoch for the age filter;
   *        the system clock when empty.
   * @throws ConfigError When the grouping settings are invalid.
   */
  BranchDriver(GitBackend &backend, const Config &config,
               SquashHistory *history = nullptr, Clock clock = {});

  /**
   * Process every allowed remote branch.
   *
   * @throws BackendError When the branch list cannot be retrieved.
   */
  RunSummary run();

private:
  BranchReport process_branch(const std::string &branch, RunSummary &summary);

  GitBackend &backend_;
  const Config &config_;
  SquashHistory *history_;
  Clock clock_;
  IdentityResolver resolver_;
  GroupingEngine engine_;
};

} // namespace agsq

#endif // AUTOGITSQUASH_BRANCH_DRIVER_HPP
