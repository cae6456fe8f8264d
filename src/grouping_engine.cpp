/**
 * @file grouping_engine.cpp
 * @brief Implements the grouping pass over one branch history.
 */
#include "grouping_engine.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

namespace agsq {

namespace {

std::shared_ptr<spdlog::logger> grouping_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("grouping");
  }();
  return logger;
}

std::regex compile_pattern(const std::string &pattern) {
  try {
    return std::regex(pattern);
  } catch (const std::regex_error &e) {
    throw ConfigError("Invalid correlation_pattern '" + pattern +
                      "': " + e.what());
  }
}

bool keys_compatible(const std::optional<std::string> &group_key,
                     const std::optional<std::string> &key) {
  return !group_key || !key || *group_key == *key;
}

} // namespace

std::size_t GroupingResult::rewritable_count() const {
  return static_cast<std::size_t>(
      std::count_if(groups.begin(), groups.end(),
                    [](const Group &g) { return g.rewritable(); }));
}

GroupingEngine::GroupingEngine(const Config &config)
    : squash_window_(config.squash_window()),
      age_filter_enabled_(config.enable_age_filter()),
      age_limit_(config.age_limit()),
      correlation_pattern_(compile_pattern(config.correlation_pattern())),
      classifier_(config.boundary_keywords(),
                  config.treat_merge_commits_as_boundaries()) {}

std::optional<std::string>
GroupingEngine::correlation_key(const std::string &message) const {
  std::smatch match;
  if (std::regex_search(message, match, correlation_pattern_)) {
    return match.str(0);
  }
  return std::nullopt;
}

bool GroupingEngine::adjacent_mergeable(const Commit &earlier,
                                        const Commit &later) const {
  if (earlier.canonical_author != later.canonical_author) {
    return false;
  }
  const std::int64_t delta = later.timestamp - earlier.timestamp;
  return delta > 0 && delta <= squash_window_.count();
}

bool GroupingEngine::too_old(const Commit &commit, std::int64_t now) const {
  return age_filter_enabled_ && now - commit.timestamp > age_limit_.count();
}

GroupingResult GroupingEngine::group(const std::vector<Commit> &commits,
                                     std::int64_t now) const {
  GroupingResult result;
  Group current;
  std::optional<std::string> current_key;

  auto close_group = [&]() {
    if (!current.commits.empty()) {
      result.groups.push_back(std::move(current));
    }
    current = Group{};
    current_key.reset();
  };

  for (const auto &commit : commits) {
    if (too_old(commit, now)) {
      grouping_log()->trace("{} excluded by age filter", commit.hash);
      ++result.filtered_count;
      close_group();
      continue;
    }
    auto classification = classifier_.classify(commit);
    if (classification.is_boundary) {
      grouping_log()->debug("{} is a boundary ({})", commit.hash,
                            to_string(classification.reason));
      ++result.boundary_count;
      close_group();
      continue;
    }

    auto key = correlation_key(commit.message);
    if (!current.commits.empty() &&
        adjacent_mergeable(current.last(), commit) &&
        keys_compatible(current_key, key)) {
      current.commits.push_back(commit);
      if (!current_key) {
        current_key = std::move(key);
      }
    } else {
      close_group();
      current.commits.push_back(commit);
      current_key = std::move(key);
    }

    // Folding a fork point into a later commit would orphan the side line.
    if (commit.forks) {
      grouping_log()->debug("{} has side history; closing group", commit.hash);
      close_group();
    }
  }
  close_group();

  grouping_log()->debug("{} commit(s) -> {} group(s), {} rewritable, {} "
                        "boundary, {} filtered",
                        commits.size(), result.groups.size(),
                        result.rewritable_count(), result.boundary_count,
                        result.filtered_count);
  return result;
}

} // namespace agsq
