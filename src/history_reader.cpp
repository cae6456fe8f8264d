/**
 * @file history_reader.cpp
 * @brief Implements HistoryReader.
 */
#include "history_reader.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <memory>

#include <spdlog/spdlog.h>

namespace agsq {

namespace {
std::shared_ptr<spdlog::logger> reader_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("git");
  }();
  return logger;
}
} // namespace

Commit HistoryReader::snapshot(const CommitRecord &record) {
  if (record.hash.empty()) {
    throw MalformedCommitRecord("commit record without hash");
  }
  if (record.author_name.empty() && record.author_email.empty()) {
    throw MalformedCommitRecord("commit " + record.hash + " has no author");
  }
  Commit commit;
  commit.hash = record.hash;
  commit.raw_author = format_author(record.author_name, record.author_email);
  commit.canonical_author =
      resolver_.resolve_author(record.author_name, record.author_email);
  commit.timestamp = record.commit_time;
  commit.message = backend_.message(record.hash);
  commit.parent_count = record.parents.size();
  commit.is_tagged = !backend_.tags_containing(record.hash).empty();
  commit.forks = record.has_side_children;
  return commit;
}

std::vector<Commit> HistoryReader::read(const std::string &branch) {
  auto records = backend_.list_commits(branch);
  std::vector<Commit> commits;
  commits.reserve(records.size());
  for (const auto &record : records) {
    commits.push_back(snapshot(record));
  }
  reader_log()->debug("Read {} commit(s) from {}", commits.size(), branch);
  return commits;
}

} // namespace agsq
