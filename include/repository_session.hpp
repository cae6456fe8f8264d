/**
 * @file repository_session.hpp
 * @brief Owns the backend connection for one run.
 */

#ifndef AUTOGITSQUASH_REPOSITORY_SESSION_HPP
#define AUTOGITSQUASH_REPOSITORY_SESSION_HPP

#include "git_backend.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace agsq {

/**
 * Single owner of the GitBackend used by a run. Components borrow the
 * backend through backend() and never outlive the session.
 */
class RepositorySession {
public:
  explicit RepositorySession(std::unique_ptr<GitBackend> backend)
      : backend_(std::move(backend)) {
    if (!backend_) {
      throw std::invalid_argument("RepositorySession requires a backend");
    }
  }

  RepositorySession(const RepositorySession &) = delete;
  RepositorySession &operator=(const RepositorySession &) = delete;

  GitBackend &backend() { return *backend_; }

private:
  std::unique_ptr<GitBackend> backend_;
};

} // namespace agsq

#endif // AUTOGITSQUASH_REPOSITORY_SESSION_HPP
