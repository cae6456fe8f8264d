/**
 * @file command_runner.hpp
 * @brief Bounded-time execution of external commands.
 */

#ifndef AUTOGITSQUASH_COMMAND_RUNNER_HPP
#define AUTOGITSQUASH_COMMAND_RUNNER_HPP

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace agsq {

/// Command line, working directory, extra environment, and time budget.
struct CommandSpec {
  std::vector<std::string> args; ///< argv; args[0] is looked up in PATH
  std::string cwd;               ///< Working directory, empty for current
  std::vector<std::pair<std::string, std::string>> env; ///< Added variables
  std::chrono::seconds timeout{30};
};

/// Exit status and captured output of a finished command.
struct CommandResult {
  int exit_code{0};
  std::string out;
  std::string err;
};

/// Render @p args as a single line for log messages.
std::string describe_command(const std::vector<std::string> &args);

/** Interface for running external commands. */
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /**
   * Run a command to completion.
   *
   * A non-zero exit code is reported in the result, not thrown.
   *
   * @throws BackendTimeout When the command exceeds CommandSpec::timeout; the
   *         process is killed first.
   * @throws BackendCommandFailure When the process cannot be started.
   */
  virtual CommandResult run(const CommandSpec &spec) = 0;
};

/** CommandRunner backed by fork/exec with piped stdout and stderr. */
class ProcessRunner : public CommandRunner {
public:
  CommandResult run(const CommandSpec &spec) override;
};

} // namespace agsq

#endif // AUTOGITSQUASH_COMMAND_RUNNER_HPP
