/**
 * @file boundary_classifier.cpp
 * @brief Implements the revert/merge/pull/tag boundary rules.
 */
#include "boundary_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace agsq {
namespace {
std::string normalize(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}
} // namespace

const char *to_string(BoundaryReason reason) {
  switch (reason) {
  case BoundaryReason::kKeyword:
    return "keyword";
  case BoundaryReason::kTagged:
    return "tagged";
  case BoundaryReason::kMerge:
    return "merge";
  case BoundaryReason::kNone:
    break;
  }
  return "none";
}

BoundaryClassifier::BoundaryClassifier(std::vector<std::string> keywords,
                                       bool merge_commits_are_boundaries)
    : merge_commits_are_boundaries_(merge_commits_are_boundaries) {
  for (auto &keyword : keywords) {
    if (!keyword.empty()) {
      keywords_.push_back(normalize(std::move(keyword)));
    }
  }
}

Classification BoundaryClassifier::classify(const Commit &commit) const {
  Classification result;
  if (commit.is_tagged) {
    result.is_boundary = true;
    result.reason = BoundaryReason::kTagged;
    return result;
  }
  if (merge_commits_are_boundaries_ && commit.parent_count > 1) {
    result.is_boundary = true;
    result.reason = BoundaryReason::kMerge;
    return result;
  }
  const std::string message = normalize(commit.message);
  for (const auto &keyword : keywords_) {
    if (message.find(keyword) != std::string::npos) {
      result.is_boundary = true;
      result.reason = BoundaryReason::kKeyword;
      result.keyword = keyword;
      return result;
    }
  }
  return result;
}

} // namespace agsq
