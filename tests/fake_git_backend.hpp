#ifndef AUTOGITSQUASH_TESTS_FAKE_GIT_BACKEND_HPP
#define AUTOGITSQUASH_TESTS_FAKE_GIT_BACKEND_HPP

#include "errors.hpp"
#include "git_backend.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace agsq::test {

struct FakeCommit {
  CommitRecord record;
  std::string message;
  bool tagged{false};
};

inline FakeCommit make_commit(const std::string &hash, const std::string &name,
                              const std::string &email, std::int64_t time,
                              const std::string &message,
                              std::size_t parents = 1, bool tagged = false) {
  FakeCommit c;
  c.record.hash = hash;
  c.record.author_name = name;
  c.record.author_email = email;
  c.record.commit_time = time;
  for (std::size_t i = 0; i < parents; ++i) {
    c.record.parents.push_back("p" + std::to_string(i));
  }
  c.message = message;
  c.tagged = tagged;
  return c;
}

/**
 * In-memory linear history per branch. collapse_range() gives every commit
 * after the range a new hash, as a real rebase would.
 */
class FakeGitBackend : public GitBackend {
public:
  std::vector<std::string> remote_branches;
  std::map<std::string, std::vector<FakeCommit>> branches;
  std::set<std::string> failing_checkout;
  std::set<std::string> failing_list;
  std::set<std::string> timeout_list;
  bool fail_collapse{false};
  bool corrupt_on_failure{false}; ///< Leave a partial rewrite before failing
  bool fail_reset{false};
  bool fail_list_branches{false};
  bool fail_list_after_collapse{false};
  std::string current;
  std::vector<std::pair<std::string, std::string>> collapses;
  std::vector<std::string> resets;

  std::vector<std::string> list_remote_branches() override {
    if (fail_list_branches) {
      throw BackendCommandFailure("git for-each-ref", 128, "not a repository");
    }
    return remote_branches;
  }

  void checkout(const std::string &branch) override {
    if (failing_checkout.count(branch) != 0) {
      throw BackendCommandFailure("git checkout " + branch, 1,
                                  "pathspec did not match");
    }
    current = branch;
  }

  std::vector<CommitRecord> list_commits(const std::string &branch) override {
    if (timeout_list.count(branch) != 0) {
      throw BackendTimeout("git log " + branch, 30);
    }
    if (failing_list.count(branch) != 0 ||
        (fail_list_after_collapse && !collapses.empty())) {
      throw BackendCommandFailure("git log " + branch, 128, "bad revision");
    }
    std::vector<CommitRecord> out;
    for (const auto &c : branches[branch]) {
      out.push_back(c.record);
    }
    return out;
  }

  std::string message(const std::string &hash) override {
    return find(hash).message;
  }

  std::vector<std::string> tags_containing(const std::string &hash) override {
    if (find(hash).tagged) {
      return {"v1.0"};
    }
    return {};
  }

  std::string head() override {
    auto &commits = branches[current];
    std::string h = commits.empty() ? std::string("empty") : commits.back().record.hash;
    snapshots_[h] = commits;
    return h;
  }

  std::string collapse_range(const std::string &first, const std::string &last,
                             const std::string &msg) override {
    auto &commits = branches[current];
    auto index_of = [&commits](const std::string &hash) {
      auto it = std::find_if(commits.begin(), commits.end(),
                             [&hash](const FakeCommit &c) {
                               return c.record.hash == hash;
                             });
      return it == commits.end()
                 ? std::string::npos
                 : static_cast<std::size_t>(it - commits.begin());
    };
    std::size_t i = index_of(first);
    std::size_t j = index_of(last);
    if (i == std::string::npos || j == std::string::npos || i > j) {
      throw BackendCommandFailure("git rev-parse " + first + ".." + last, 128,
                                  "unknown revision");
    }
    if (fail_collapse) {
      if (corrupt_on_failure) {
        commits.erase(commits.begin() + static_cast<std::ptrdiff_t>(i),
                      commits.end());
      }
      throw BackendCommandFailure("git rebase", 1, "conflict");
    }
    FakeCommit squashed = commits[j];
    squashed.record.hash = "s" + std::to_string(++next_id_);
    squashed.record.parents = commits[i].record.parents;
    squashed.message = msg;
    std::vector<FakeCommit> rewritten(commits.begin(),
                                      commits.begin() +
                                          static_cast<std::ptrdiff_t>(i));
    rewritten.push_back(squashed);
    for (std::size_t k = j + 1; k < commits.size(); ++k) {
      FakeCommit moved = commits[k];
      moved.record.hash += "'";
      rewritten.push_back(moved);
    }
    commits = std::move(rewritten);
    collapses.emplace_back(first, last);
    return squashed.record.hash;
  }

  void reset_to_ref(const std::string &ref) override {
    if (fail_reset) {
      throw BackendCommandFailure("git reset --hard " + ref, 128, "locked");
    }
    auto it = snapshots_.find(ref);
    if (it == snapshots_.end()) {
      throw BackendCommandFailure("git reset --hard " + ref, 128,
                                  "unknown revision");
    }
    branches[current] = it->second;
    resets.push_back(ref);
  }

  /// Hashes of @p branch, oldest first.
  std::vector<std::string> hashes(const std::string &branch) {
    std::vector<std::string> out;
    for (const auto &c : branches[branch]) {
      out.push_back(c.record.hash);
    }
    return out;
  }

private:
  const FakeCommit &find(const std::string &hash) {
    for (const auto &c : branches[current]) {
      if (c.record.hash == hash) {
        return c;
      }
    }
    throw BackendCommandFailure("git log -1 " + hash, 128, "unknown revision");
  }

  std::map<std::string, std::vector<FakeCommit>> snapshots_;
  int next_id_{0};
};

} // namespace agsq::test

#endif // AUTOGITSQUASH_TESTS_FAKE_GIT_BACKEND_HPP
