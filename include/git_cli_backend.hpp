/**
 * @file git_cli_backend.hpp
 * @brief GitBackend implementation that drives the `git` executable.
 */

#ifndef AUTOGITSQUASH_GIT_CLI_BACKEND_HPP
#define AUTOGITSQUASH_GIT_CLI_BACKEND_HPP

#include "command_runner.hpp"
#include "git_backend.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace agsq {

/// Settings for GitCliBackend.
struct GitCliOptions {
  std::string repository_path{"."};
  std::string remote{"origin"};
  std::string git_executable{"git"};
  std::chrono::seconds timeout{30};
};

/**
 * Runs git subcommands in a working copy through a CommandRunner.
 *
 * collapse_range() is composed from lower-level primitives: `commit-tree`
 * builds the replacement commit from the last member's tree, and
 * `rebase --onto` replays whatever follows the range. Any failure aborts a
 * pending rebase and hard-resets to the head recorded before the attempt.
 */
class GitCliBackend : public GitBackend {
public:
  /**
   * @param options Repository location, remote, executable and timeout.
   * @param runner Command runner; a ProcessRunner is used when null.
   */
  explicit GitCliBackend(GitCliOptions options,
                         std::unique_ptr<CommandRunner> runner = nullptr);

  std::vector<std::string> list_remote_branches() override;
  void checkout(const std::string &branch) override;
  std::vector<CommitRecord> list_commits(const std::string &branch) override;
  std::string message(const std::string &hash) override;
  std::vector<std::string> tags_containing(const std::string &hash) override;
  std::string head() override;
  std::string collapse_range(const std::string &first, const std::string &last,
                             const std::string &message) override;
  void reset_to_ref(const std::string &ref) override;

  const GitCliOptions &options() const { return options_; }

  /**
   * Parse `git log` output produced with the record format used by
   * list_commits(): fields separated by 0x1f, records terminated by 0x1e.
   *
   * @throws MalformedCommitRecord On a missing field, empty hash, or a
   *         timestamp that is not an integer.
   */
  static std::vector<CommitRecord> parse_log_records(const std::string &raw);

  /**
   * Set CommitRecord::has_side_children from `git rev-list --children`
   * output (`<hash> <child>...` per line). @p records must be the
   * first-parent chain, oldest first; the next record is the only child
   * that does not count as a side child.
   */
  static void mark_side_children(std::vector<CommitRecord> &records,
                                 const std::string &children_listing);

private:
  /// Run git with @p args; throws BackendCommandFailure on non-zero exit.
  std::string git(const std::vector<std::string> &args,
                  const std::vector<std::pair<std::string, std::string>> &env =
                      {});
  /// Run git with @p args and return the result without checking it.
  CommandResult git_unchecked(
      const std::vector<std::string> &args,
      const std::vector<std::pair<std::string, std::string>> &env = {});

  std::string build_collapsed_commit(const std::string &first,
                                     const std::string &last,
                                     const std::string &message);
  void restore(const std::string &saved_head);

  GitCliOptions options_;
  std::unique_ptr<CommandRunner> runner_;
};

} // namespace agsq

#endif // AUTOGITSQUASH_GIT_CLI_BACKEND_HPP
