#include "app.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "squash_history.hpp"
#include "util/duration.hpp"
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace agsq {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}
} // namespace

void App::apply_cli_overrides() {
  config_.set_verbose(options_.verbose || config_.verbose());
  config_.set_assume_yes(options_.assume_yes || config_.assume_yes());
  config_.set_dry_run(options_.dry_run || config_.dry_run());
  if (!options_.repository_path.empty()) {
    config_.set_repository_path(options_.repository_path);
  }
  if (!options_.remote.empty()) {
    config_.set_remote(options_.remote);
  }
  if (!options_.include_branches.empty()) {
    config_.set_include_branches(options_.include_branches);
  }
  if (!options_.exclude_branches.empty()) {
    config_.set_exclude_branches(options_.exclude_branches);
  }
  if (options_.squash_window_explicit) {
    config_.set_squash_window(options_.squash_window);
  }
  if (options_.age_limit_explicit) {
    config_.set_age_limit(options_.age_limit);
  }
  if (options_.age_filter_explicit) {
    config_.set_enable_age_filter(options_.age_filter);
  }
  if (options_.git_timeout_explicit) {
    config_.set_git_timeout(options_.git_timeout);
  }
  if (!options_.history_db.empty()) {
    config_.set_history_db(options_.history_db);
  }
  if (!options_.export_csv.empty()) {
    config_.set_export_csv(options_.export_csv);
  }
  if (!options_.export_json.empty()) {
    config_.set_export_json(options_.export_json);
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (options_.log_rotate_explicit) {
    config_.set_log_rotate(options_.log_rotate);
  }
  if (options_.log_compress_explicit) {
    config_.set_log_compress(options_.log_compress);
  }
  if (options_.log_categories_explicit) {
    config_.set_log_categories(options_.log_categories);
  }
  if (options_.log_level != "info") {
    config_.set_log_level(options_.log_level);
  } else if (options_.verbose && config_.log_level() == "info") {
    config_.set_log_level("debug");
  }
}

void App::setup_logging() {
  auto lvl = spdlog::level::from_str(config_.log_level());
  if (lvl == spdlog::level::off && config_.log_level() != "off") {
    app_log()->warn("Unknown log level '{}', using info", config_.log_level());
    lvl = spdlog::level::info;
  }
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress());
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : config_.log_categories()) {
    auto level = spdlog::level::from_str(level_str);
    if (level == spdlog::level::off && level_str != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_str, category);
      continue;
    }
    category_levels[category] = level;
  }
  configure_log_categories(category_levels);
}

bool App::confirm() {
  out_ << "Rewriting the history of " << config_.repository_path()
       << " cannot be undone. Continue? [y/N]: ";
  out_.flush();
  std::string resp;
  std::getline(in_, resp);
  return resp == "y" || resp == "Y" || resp == "yes" || resp == "YES";
}

/**
 * Execute the setup phase of the application.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Zero on success, non-zero if execution should terminate with an
 *         error code.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  }
  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
    apply_cli_overrides();
  } catch (const ConfigError &e) {
    app_log()->error("Configuration error: {}", e.what());
    should_exit_ = true;
    return 1;
  }
  setup_logging();
  app_log()->debug("Squash window {}, age filter {} ({})",
                   format_duration(config_.squash_window()),
                   config_.enable_age_filter() ? "on" : "off",
                   format_duration(config_.age_limit()));
  if (config_.dry_run()) {
    app_log()->info("Dry run mode enabled");
  } else if (!config_.assume_yes() && !confirm()) {
    app_log()->error("Operation cancelled by user");
    should_exit_ = true;
    return 1;
  }
  return 0;
}

int App::squash(GitBackend &backend) {
  SquashHistory history(config_.history_db());
  try {
    BranchDriver driver(backend, config_, &history);
    summary_ = driver.run();
  } catch (const ConfigError &e) {
    app_log()->error("Configuration error: {}", e.what());
    return 1;
  } catch (const BackendError &e) {
    app_log()->error("Cannot list branches: {}", e.what());
    return 1;
  }

  if (!config_.export_csv().empty()) {
    history.export_csv(config_.export_csv());
    app_log()->info("Squash results exported to {}", config_.export_csv());
  }
  if (!config_.export_json().empty()) {
    history.export_json(config_.export_json());
    app_log()->info("Squash results exported to {}", config_.export_json());
  }
  print_summary();
  return summary_.success() ? 0 : 1;
}

void App::print_summary() {
  app_log()->info("Branches: {} processed, {} skipped, {} aborted, {} "
                  "filtered",
                  summary_.count(BranchStatus::kProcessed),
                  summary_.count(BranchStatus::kSkipped),
                  summary_.count(BranchStatus::kAborted),
                  summary_.count(BranchStatus::kFiltered));
  if (summary_.aborted) {
    app_log()->error("Run terminated due to an error: {}",
                     summary_.abort_reason);
    if (!summary_.rolled_back) {
      app_log()->critical("The last branch could not be restored; inspect "
                          "the repository before continuing");
    }
    return;
  }
  if (config_.dry_run()) {
    out_ << "Dry run complete: " << summary_.planned
         << " group(s) would be squashed." << std::endl;
    return;
  }
  out_ << "Done squashing commits (" << summary_.results.size()
       << " squash(es)). Please review the changes before pushing."
       << std::endl;
  out_ << "If you're satisfied with the changes, you can push all branches "
          "to the new repository with:"
       << std::endl;
  out_ << "git push --all <new-repo-url>" << std::endl;
}

} // namespace agsq
