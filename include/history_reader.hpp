/**
 * @file history_reader.hpp
 * @brief Builds Commit snapshots of one branch from a GitBackend.
 */

#ifndef AUTOGITSQUASH_HISTORY_READER_HPP
#define AUTOGITSQUASH_HISTORY_READER_HPP

#include "commit.hpp"
#include "git_backend.hpp"
#include "identity_resolver.hpp"

#include <string>
#include <vector>

namespace agsq {

/**
 * Reads the history of the checked out branch and resolves each author.
 *
 * The reader borrows both the backend and the resolver.
 */
class HistoryReader {
public:
  HistoryReader(GitBackend &backend, const IdentityResolver &resolver)
      : backend_(backend), resolver_(resolver) {}

  /**
   * Snapshot every commit of @p branch, oldest first.
   *
   * @throws MalformedCommitRecord When a record lacks a hash or an author.
   * @throws BackendError When a backend call fails.
   */
  std::vector<Commit> read(const std::string &branch);

  /// Convert one backend record, fetching its message and tags.
  Commit snapshot(const CommitRecord &record);

private:
  GitBackend &backend_;
  const IdentityResolver &resolver_;
};

} // namespace agsq

#endif // AUTOGITSQUASH_HISTORY_READER_HPP
