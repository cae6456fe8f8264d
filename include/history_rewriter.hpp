/**
 * @file history_rewriter.hpp
 * @brief Collapses one group into a single commit, all or nothing.
 */

#ifndef AUTOGITSQUASH_HISTORY_REWRITER_HPP
#define AUTOGITSQUASH_HISTORY_REWRITER_HPP

#include "commit.hpp"
#include "git_backend.hpp"

#include <string>

namespace agsq {

/**
 * Joins the messages of @p group, oldest first, each stripped of trailing
 * whitespace and separated by a blank line. Empty messages are skipped.
 */
std::string combined_message(const Group &group);

/**
 * Rewrites groups on the checked out branch.
 *
 * Either the group is replaced by one commit and later commits are replayed
 * on top, or the branch is left exactly at the head recorded before the
 * attempt.
 */
class HistoryRewriter {
public:
  explicit HistoryRewriter(GitBackend &backend) : backend_(backend) {}

  /**
   * Collapse @p group, which must have at least two members.
   *
   * @return Result carrying the hash of the replacement commit; the branch
   *         field is left empty for the caller to fill in.
   * @throws RewriteError When the backend fails. rolled_back() reports
   *         whether the branch is known to be back at its original head.
   */
  SquashResult rewrite(const Group &group);

private:
  bool roll_back(const std::string &saved_head);

  GitBackend &backend_;
};

} // namespace agsq

#endif // AUTOGITSQUASH_HISTORY_REWRITER_HPP
