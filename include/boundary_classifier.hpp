/**
 * @file boundary_classifier.hpp
 * @brief Detection of commits that must never be squashed.
 */

#ifndef AUTOGITSQUASH_BOUNDARY_CLASSIFIER_HPP
#define AUTOGITSQUASH_BOUNDARY_CLASSIFIER_HPP

#include "commit.hpp"

#include <string>
#include <vector>

namespace agsq {

/// Why a commit was classified as a boundary.
enum class BoundaryReason {
  kNone,    ///< Not a boundary.
  kKeyword, ///< Message contains a boundary keyword (revert, merge, pull).
  kTagged,  ///< Reachable from a tag.
  kMerge    ///< Has more than one parent.
};

/// Lowercase name of @p reason for log output.
const char *to_string(BoundaryReason reason);

struct Classification {
  bool is_boundary{false};
  BoundaryReason reason{BoundaryReason::kNone};
  std::string keyword; ///< Matched keyword when reason is kKeyword
};

/**
 * Rule based classifier deciding whether a commit terminates a group.
 *
 * Keyword matching is a case-insensitive substring search over the full
 * message, so "Reverted", "merge branch" and "Pull request #4" all match.
 */
class BoundaryClassifier {
public:
  /**
   * @param keywords Boundary keywords; matched case-insensitively.
   * @param merge_commits_are_boundaries Treat commits with more than one
   *        parent as boundaries regardless of their message.
   */
  explicit BoundaryClassifier(std::vector<std::string> keywords,
                              bool merge_commits_are_boundaries = true);

  Classification classify(const Commit &commit) const;

  const std::vector<std::string> &keywords() const { return keywords_; }

private:
  std::vector<std::string> keywords_; ///< Stored lowercase
  bool merge_commits_are_boundaries_;
};

} // namespace agsq

#endif // AUTOGITSQUASH_BOUNDARY_CLASSIFIER_HPP
