/**
 * @file commit.hpp
 * @brief Commit snapshots, groups, and squash results.
 */

#ifndef AUTOGITSQUASH_COMMIT_HPP
#define AUTOGITSQUASH_COMMIT_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace agsq {

/**
 * Read-only snapshot of one commit taken for a single grouping pass.
 */
struct Commit {
  std::string hash;             ///< Unique id within the branch history
  std::string raw_author;       ///< `Name <email>` as reported by the backend
  std::string canonical_author; ///< raw_author resolved through the aliases
  std::int64_t timestamp{0};    ///< Commit time, seconds since epoch
  std::string message;          ///< Full message body, may be empty
  std::size_t parent_count{0};  ///< More than one means a merge commit
  bool is_tagged{false};        ///< Reachable from at least one tag
  bool forks{false};            ///< Side history branches off here
};

/**
 * Contiguous run of mergeable commits, oldest first. Never empty.
 */
struct Group {
  std::vector<Commit> commits;

  std::size_t size() const { return commits.size(); }
  const Commit &first() const { return commits.front(); }
  const Commit &last() const { return commits.back(); }

  /// Only groups with at least two members are collapsed.
  bool rewritable() const { return commits.size() >= 2; }
};

/// Outcome of one successful collapse.
struct SquashResult {
  std::string branch;
  std::vector<std::string> original_commits; ///< Oldest first
  std::string original_author;               ///< Canonical author of the run
  std::string new_commit;
  std::string message;
};

} // namespace agsq

#endif // AUTOGITSQUASH_COMMIT_HPP
