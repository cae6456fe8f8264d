/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for autogitsquash.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */
#ifndef AUTOGITSQUASH_CLI_HPP
#define AUTOGITSQUASH_CLI_HPP

#include <chrono>
#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace agsq {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Numeric process exit code.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options supplied via the CLI.
 *
 * Values marked by an `_explicit` companion only override configuration when
 * that companion is set.
 */
struct CliOptions {
  bool verbose = false;           ///< Enables verbose output
  std::string config_file;        ///< Optional path to configuration file
  std::string log_level = "info"; ///< Logging verbosity level
  std::string log_file;           ///< Optional path to rotating log file
  int log_rotate{3}; ///< Number of rotated log files to keep (0 disables)
  bool log_compress{false};          ///< Compress rotated log files
  bool log_rotate_explicit{false};   ///< True if CLI set log rotation count
  bool log_compress_explicit{false}; ///< True if CLI toggled log compression
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI
  bool log_categories_explicit{false}; ///< True if CLI specified categories
  bool assume_yes{false};              ///< Skip confirmation prompts
  bool dry_run{false};                 ///< Report groups without rewriting
  std::string repository_path;         ///< Working copy to rewrite
  std::string remote;                  ///< Remote whose branches are listed
  std::vector<std::string> include_branches; ///< Branch globs to process
  std::vector<std::string> exclude_branches; ///< Branch globs to skip
  std::chrono::seconds squash_window{0};     ///< Max gap inside a group
  bool squash_window_explicit{false};
  std::chrono::seconds age_limit{0}; ///< Age filter threshold
  bool age_limit_explicit{false};
  bool age_filter{false}; ///< Exclude commits older than age_limit
  bool age_filter_explicit{false};
  std::chrono::seconds git_timeout{0}; ///< Timeout for each git call
  bool git_timeout_explicit{false};
  std::string history_db;  ///< SQLite squash ledger path
  std::string export_csv;  ///< Path to export CSV file
  std::string export_json; ///< Path to export JSON file
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Null-terminated array of raw CLI argument strings.
 * @return Populated options structure describing the requested behaviour.
 * @throws CliParseExit When parsing encounters conditions such as `--help`,
 *         `--version` or invalid input that require an early exit.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace agsq

#endif // AUTOGITSQUASH_CLI_HPP
