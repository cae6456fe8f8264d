/**
 * @file git_backend.hpp
 * @brief Abstract version-control backend consumed by the squash pipeline.
 *
 * Every call is synchronous. Implementations report failures by throwing
 * BackendTimeout or BackendCommandFailure, and MalformedCommitRecord when a
 * response cannot be interpreted.
 */

#ifndef AUTOGITSQUASH_GIT_BACKEND_HPP
#define AUTOGITSQUASH_GIT_BACKEND_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace agsq {

/// Structured per-commit metadata returned by GitBackend::list_commits().
struct CommitRecord {
  std::string hash;
  std::string author_name;
  std::string author_email;
  std::int64_t commit_time{0};      ///< Seconds since epoch
  std::vector<std::string> parents; ///< Parent hashes, empty for a root
  /// Some commit of the branch other than the next listed one has this
  /// commit as a parent (a side line forks here).
  bool has_side_children{false};
};

/** Interface to the repository being rewritten. */
class GitBackend {
public:
  virtual ~GitBackend() = default;

  /**
   * List branches of the configured remote, without the remote prefix and
   * without symbolic entries such as `HEAD`.
   */
  virtual std::vector<std::string> list_remote_branches() = 0;

  /// Check out @p branch, creating a local tracking branch when needed.
  virtual void checkout(const std::string &branch) = 0;

  /// First-parent history of @p branch, oldest first.
  virtual std::vector<CommitRecord> list_commits(const std::string &branch) = 0;

  /// Full message of commit @p hash.
  virtual std::string message(const std::string &hash) = 0;

  /// Tags whose history contains @p hash.
  virtual std::vector<std::string> tags_containing(const std::string &hash) = 0;

  /// Hash of the currently checked out commit.
  virtual std::string head() = 0;

  /**
   * Replace the contiguous range [@p first, @p last] of the checked out
   * branch with one commit carrying @p message and the tree of @p last.
   * Commits after @p last are replayed on top.
   *
   * Implementations restore the branch before throwing.
   *
   * @return Hash of the commit that replaced @p last.
   */
  virtual std::string collapse_range(const std::string &first,
                                     const std::string &last,
                                     const std::string &message) = 0;

  /// Hard-reset the checked out branch and working copy to @p ref.
  virtual void reset_to_ref(const std::string &ref) = 0;
};

} // namespace agsq

#endif // AUTOGITSQUASH_GIT_BACKEND_HPP
