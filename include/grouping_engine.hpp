/**
 * @file grouping_engine.hpp
 * @brief Single-pass grouping of commits into squashable runs.
 */

#ifndef AUTOGITSQUASH_GROUPING_ENGINE_HPP
#define AUTOGITSQUASH_GROUPING_ENGINE_HPP

#include "boundary_classifier.hpp"
#include "commit.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace agsq {

class Config;

/**
 * @brief Groups of one branch plus the commits that were left out.
 *
 * The groups, in order, partition every commit that was neither a boundary
 * nor filtered by age.
 */
struct GroupingResult {
  std::vector<Group> groups;
  std::size_t boundary_count{0}; ///< Boundary commits excluded from groups
  std::size_t filtered_count{0}; ///< Commits excluded by the age filter

  /// Number of groups large enough to be collapsed.
  std::size_t rewritable_count() const;
};

/**
 * @brief Walks a branch history once and emits maximal mergeable runs.
 *
 * Two chronologically adjacent commits are mergeable when their canonical
 * authors match, the later one is strictly newer by at most the squash
 * window, and its correlation key is compatible with the key of the open
 * group. A group's key is the first key seen among its members; a commit
 * without a key is compatible with any group and a group without a key
 * accepts any commit.
 *
 * A commit that other history forks from may end a group but is never
 * followed by another member.
 */
class GroupingEngine {
public:
  /**
   * Build an engine from squash settings. The configuration is read once;
   * it does not need to outlive the engine.
   *
   * @throws ConfigError When the correlation pattern is not a valid regex.
   */
  explicit GroupingEngine(const Config &config);

  /**
   * Group @p commits (oldest first).
   *
   * @param commits Branch history, oldest first.
   * @param now Current time in seconds since epoch, used by the age filter.
   */
  GroupingResult group(const std::vector<Commit> &commits,
                       std::int64_t now) const;

  /// Issue-tracker key in @p message (e.g. `ABC-123`), if any.
  std::optional<std::string> correlation_key(const std::string &message) const;

  /// Adjacency rule: same canonical author and 0 < delta <= squash window.
  bool adjacent_mergeable(const Commit &earlier, const Commit &later) const;

private:
  bool too_old(const Commit &commit, std::int64_t now) const;

  std::chrono::seconds squash_window_;
  bool age_filter_enabled_;
  std::chrono::seconds age_limit_;
  std::regex correlation_pattern_;
  BoundaryClassifier classifier_;
};

} // namespace agsq

#endif // AUTOGITSQUASH_GROUPING_ENGINE_HPP
