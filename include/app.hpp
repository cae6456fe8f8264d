/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for autogitsquash.
 *
 * Declares the App class, which manages CLI parsing, configuration loading,
 * logger setup and the squash run itself.
 */

#ifndef AUTOGITSQUASH_APP_HPP
#define AUTOGITSQUASH_APP_HPP

#include "branch_driver.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "git_backend.hpp"

#include <iostream>

namespace agsq {

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * @param in Stream answering the confirmation prompt.
   * @param out Stream receiving the prompt and the final summary.
   */
  explicit App(std::istream &in = std::cin, std::ostream &out = std::cout)
      : in_(in), out_(out) {}

  /**
   * Parse arguments, load configuration, apply CLI overrides, initialize
   * logging and ask for confirmation before a destructive run.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when execution should terminate due to
   *         an error.
   */
  int run(int argc, char **argv);

  /**
   * Squash every allowed branch of @p backend using the resolved
   * configuration, record results, export artifacts and print the summary.
   *
   * @return Zero when every branch was processed, one otherwise.
   */
  int squash(GitBackend &backend);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Configuration after CLI overrides were applied.
  const Config &config() const { return config_; }

  /// Summary of the last squash() call.
  const RunSummary &summary() const { return summary_; }

  /**
   * Determine whether the application should exit immediately after
   * `run()` completes.
   */
  bool should_exit() const { return should_exit_; }

private:
  void apply_cli_overrides();
  void setup_logging();
  bool confirm();
  void print_summary();

  std::istream &in_;
  std::ostream &out_;
  CliOptions options_;
  Config config_;
  RunSummary summary_;
  bool should_exit_{false};
};

} // namespace agsq

#endif // AUTOGITSQUASH_APP_HPP
