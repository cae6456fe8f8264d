/**
 * @file history_rewriter.cpp
 * @brief Implements HistoryRewriter and message combination.
 */
#include "history_rewriter.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace agsq {

namespace {
std::shared_ptr<spdlog::logger> rewrite_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("rewrite");
  }();
  return logger;
}

std::string rtrim(const std::string &s) {
  auto end = s.find_last_not_of(" \t\r\n");
  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}
} // namespace

std::string combined_message(const Group &group) {
  std::string out;
  for (const auto &commit : group.commits) {
    std::string body = rtrim(commit.message);
    if (body.empty()) {
      continue;
    }
    if (!out.empty()) {
      out += "\n\n";
    }
    out += body;
  }
  return out;
}

bool HistoryRewriter::roll_back(const std::string &saved_head) {
  try {
    if (backend_.head() != saved_head) {
      backend_.reset_to_ref(saved_head);
    }
    return true;
  } catch (const BackendError &e) {
    rewrite_log()->critical("Failed to restore {}: {}", saved_head, e.what());
    return false;
  }
}

SquashResult HistoryRewriter::rewrite(const Group &group) {
  if (!group.rewritable()) {
    throw std::invalid_argument("group must contain at least two commits");
  }
  const std::string message = combined_message(group);
  std::string saved_head;
  try {
    saved_head = backend_.head();
  } catch (const BackendError &e) {
    throw RewriteError(std::string("cannot read head: ") + e.what(), true);
  }

  SquashResult result;
  try {
    result.new_commit =
        backend_.collapse_range(group.first().hash, group.last().hash, message);
  } catch (const BackendError &e) {
    rewrite_log()->error("Collapsing {}..{} failed: {}", group.first().hash,
                         group.last().hash, e.what());
    bool restored = roll_back(saved_head);
    throw RewriteError("failed to squash " + group.first().hash + ".." +
                           group.last().hash + ": " + e.what(),
                       restored);
  }
  for (const auto &commit : group.commits) {
    result.original_commits.push_back(commit.hash);
  }
  result.original_author = group.last().canonical_author;
  result.message = message;
  rewrite_log()->debug("Collapsed {} commit(s) into {}", group.size(),
                       result.new_commit);
  return result;
}

} // namespace agsq
