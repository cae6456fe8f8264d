/**
 * @file errors.hpp
 * @brief Exception hierarchy shared by autogitsquash components.
 *
 * Declares configuration, backend, record parsing, and rewrite failures so
 * callers can decide between skipping a branch and aborting the whole run.
 */

#ifndef AUTOGITSQUASH_ERRORS_HPP
#define AUTOGITSQUASH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace agsq {

/// Raised when configuration content is malformed. Fatal at startup.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * Base class for failures reported by a version-control backend call.
 *
 * Carries the command (or operation) that failed so log lines can name it.
 */
class BackendError : public std::runtime_error {
public:
  BackendError(const std::string &operation, const std::string &message)
      : std::runtime_error(operation + ": " + message), operation_(operation) {}

  /// Operation or command line that failed.
  const std::string &operation() const noexcept { return operation_; }

private:
  std::string operation_;
};

/// Backend call exceeded its time budget.
class BackendTimeout : public BackendError {
public:
  BackendTimeout(const std::string &operation, int timeout_seconds)
      : BackendError(operation, "timed out after " +
                                    std::to_string(timeout_seconds) + "s"),
        timeout_seconds_(timeout_seconds) {}

  int timeout_seconds() const noexcept { return timeout_seconds_; }

private:
  int timeout_seconds_;
};

/// Backend command exited unsuccessfully or could not be started.
class BackendCommandFailure : public BackendError {
public:
  BackendCommandFailure(const std::string &operation, int exit_code,
                        const std::string &detail)
      : BackendError(operation, "exit code " + std::to_string(exit_code) +
                                    (detail.empty() ? "" : ": " + detail)),
        exit_code_(exit_code), detail_(detail) {}

  int exit_code() const noexcept { return exit_code_; }

  /// Captured diagnostic output (usually stderr) of the failed command.
  const std::string &detail() const noexcept { return detail_; }

private:
  int exit_code_;
  std::string detail_;
};

/// A commit record returned by the backend could not be interpreted.
class MalformedCommitRecord : public std::runtime_error {
public:
  explicit MalformedCommitRecord(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * Collapsing a group failed. The repository was reset to the head recorded
 * before the attempt when @ref rolled_back() is true.
 */
class RewriteError : public std::runtime_error {
public:
  RewriteError(const std::string &message, bool rolled_back)
      : std::runtime_error(message), rolled_back_(rolled_back) {}

  bool rolled_back() const noexcept { return rolled_back_; }

private:
  bool rolled_back_;
};

} // namespace agsq

#endif // AUTOGITSQUASH_ERRORS_HPP
