#include "cli.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <spdlog/spdlog.h>

namespace agsq {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 11> categories = {
      "app",     "cli",     "config",  "driver",  "git",    "grouping",
      "history", "logging", "main",    "process", "rewrite"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., git=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

/// Parse a duration option value, reporting failures as CLI validation errors.
std::chrono::seconds duration_option(const std::string &flag,
                                     const std::string &value) {
  try {
    return parse_duration(value);
  } catch (const std::runtime_error &e) {
    throw CLI::ValidationError(flag, e.what());
  }
}
} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"autogitsquash: squash consecutive commits per author"};
  app.footer(log_category_help_text());
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (YAML, TOML or JSON)")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "autogitsquash " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_flag("-y,--yes", options.assume_yes,
               "Assume yes to confirmation prompts")
      ->group("General");
  app.add_flag("-D,--dry-run", options.dry_run,
               "Report groups that would be squashed without rewriting")
      ->group("General");

  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->default_val("info")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_flag_function(
         "--log-compress",
         [&options](std::size_t) {
           options.log_compress = true;
           options.log_compress_explicit = true;
         },
         "Gzip rotated log files")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
           options.log_categories_explicit = true;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  app.add_option("-R,--repo", options.repository_path,
                 "Working copy of the repository to rewrite")
      ->type_name("PATH")
      ->group("Repository");
  app.add_option("--remote", options.remote,
                 "Remote whose branches are processed")
      ->type_name("NAME")
      ->group("Repository");
  app.add_option("-B,--branch", options.include_branches,
                 "Only process branches matching this glob (repeatable)")
      ->type_name("GLOB")
      ->group("Repository");
  app.add_option("-X,--exclude-branch", options.exclude_branches,
                 "Skip branches matching this glob (repeatable)")
      ->type_name("GLOB")
      ->group("Repository");
  app.add_option_function<std::string>(
         "--git-timeout",
         [&options](const std::string &value) {
           auto timeout = duration_option("--git-timeout", value);
           if (timeout.count() < 1) {
             throw CLI::ValidationError("--git-timeout",
                                        "timeout must be at least 1s");
           }
           options.git_timeout = timeout;
           options.git_timeout_explicit = true;
         },
         "Timeout for each git invocation (e.g. 30s, 2m)")
      ->type_name("DURATION")
      ->group("Repository");

  app.add_option_function<std::string>(
         "-W,--squash-window",
         [&options](const std::string &value) {
           options.squash_window = duration_option("--squash-window", value);
           options.squash_window_explicit = true;
         },
         "Maximum time between two commits of one group (e.g. 14d, 6h)")
      ->type_name("DURATION")
      ->group("Squashing");
  app.add_option_function<std::string>(
         "--age-limit",
         [&options](const std::string &value) {
           options.age_limit = duration_option("--age-limit", value);
           options.age_limit_explicit = true;
         },
         "Age beyond which commits are left alone when the age filter is on")
      ->type_name("DURATION")
      ->group("Squashing");
  app.add_flag_function(
         "--age-filter",
         [&options](std::size_t) {
           options.age_filter = true;
           options.age_filter_explicit = true;
         },
         "Exclude commits older than the age limit")
      ->group("Squashing");
  app.add_flag_function(
         "--no-age-filter",
         [&options](std::size_t) {
           options.age_filter = false;
           options.age_filter_explicit = true;
         },
         "Consider commits of any age")
      ->group("Squashing");

  app.add_option("--history-db", options.history_db,
                 "SQLite database recording performed squashes")
      ->type_name("FILE")
      ->group("Artifacts");
  app.add_option("--export-csv", options.export_csv,
                 "Export the squash ledger to CSV after the run")
      ->type_name("FILE")
      ->group("Artifacts");
  app.add_option("--export-json", options.export_json,
                 "Export the squash ledger to JSON after the run")
      ->type_name("FILE")
      ->group("Artifacts");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  cli_log()->debug("Parsed {} argument(s)", argc > 0 ? argc - 1 : 0);
  return options;
}

} // namespace agsq
