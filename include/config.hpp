#ifndef AUTOGITSQUASH_CONFIG_HPP
#define AUTOGITSQUASH_CONFIG_HPP

#include "identity_resolver.hpp"
#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agsq {

/// Default squash window and age limit: two weeks.
inline constexpr std::chrono::seconds kDefaultSquashWindow{1209600};

/// Default correlation key pattern matching issue keys such as `ABC-123`.
inline constexpr const char *kDefaultCorrelationPattern =
    R"(\b[A-Z]+-\d{1,5}\b)";

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /** Check whether verbose output is enabled. */
  bool verbose() const { return verbose_; }

  /// Set verbose output mode.
  void set_verbose(bool verbose) { verbose_ = verbose; }

  /// Maximum time between two adjacent commits of one group.
  std::chrono::seconds squash_window() const { return squash_window_; }

  /// Set the squash window; negative values raise ConfigError.
  void set_squash_window(std::chrono::seconds window);

  /// Commits older than this are excluded when the age filter is enabled.
  std::chrono::seconds age_limit() const { return age_limit_; }

  /// Set the age limit; negative values raise ConfigError.
  void set_age_limit(std::chrono::seconds limit);

  /// Whether commits older than age_limit() are excluded from grouping.
  bool enable_age_filter() const { return enable_age_filter_; }

  /// Enable or disable the age filter.
  void set_enable_age_filter(bool enable) { enable_age_filter_ = enable; }

  /// Keywords that make a commit a boundary when found in its message.
  const std::vector<std::string> &boundary_keywords() const {
    return boundary_keywords_;
  }

  /// Replace the boundary keywords.
  void set_boundary_keywords(std::vector<std::string> keywords) {
    boundary_keywords_ = std::move(keywords);
  }

  /// Whether commits with more than one parent are boundaries.
  bool treat_merge_commits_as_boundaries() const {
    return treat_merge_commits_as_boundaries_;
  }

  /// Set merge commit boundary handling.
  void set_treat_merge_commits_as_boundaries(bool enable) {
    treat_merge_commits_as_boundaries_ = enable;
  }

  /// Regular expression extracting correlation keys from messages.
  const std::string &correlation_pattern() const {
    return correlation_pattern_;
  }

  /// Set the correlation pattern; an invalid regex raises ConfigError.
  void set_correlation_pattern(const std::string &pattern);

  /// Alias lookup table built from the configured entries.
  const AliasTable &aliases() const { return aliases_; }

  /// Replace the alias entries; conflicting entries raise ConfigError.
  void set_aliases(const std::vector<AliasEntry> &entries);

  /// Working copy of the repository being rewritten.
  const std::string &repository_path() const { return repository_path_; }

  /// Set the working copy path.
  void set_repository_path(const std::string &path) { repository_path_ = path; }

  /// Remote whose branches are processed.
  const std::string &remote() const { return remote_; }

  /// Set the remote name.
  void set_remote(const std::string &remote) { remote_ = remote; }

  /// Git executable name or path.
  const std::string &git_executable() const { return git_executable_; }

  /// Set the git executable.
  void set_git_executable(const std::string &exe) { git_executable_ = exe; }

  /// Timeout applied to every git invocation.
  std::chrono::seconds git_timeout() const { return git_timeout_; }

  /// Set the git timeout; values below one second raise ConfigError.
  void set_git_timeout(std::chrono::seconds timeout);

  /// Branch globs to process (empty = all).
  const std::vector<std::string> &include_branches() const {
    return include_branches_;
  }

  /// Set branch include globs.
  void set_include_branches(std::vector<std::string> globs) {
    include_branches_ = std::move(globs);
  }

  /// Branch globs to skip.
  const std::vector<std::string> &exclude_branches() const {
    return exclude_branches_;
  }

  /// Set branch exclude globs.
  void set_exclude_branches(std::vector<std::string> globs) {
    exclude_branches_ = std::move(globs);
  }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to rotating log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for rotating log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to retain (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to retain.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Whether rotated log files are compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated log files.
  void set_log_compress(bool enable) { log_compress_ = enable; }

  /// Per-category log level overrides (category -> level name).
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace the category overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /// Path to the squash history database.
  const std::string &history_db() const { return history_db_; }

  /// Set squash history database path.
  void set_history_db(const std::string &path) { history_db_ = path; }

  /// CSV export destination (empty = no export).
  const std::string &export_csv() const { return export_csv_; }

  /// Set CSV export destination.
  void set_export_csv(const std::string &path) { export_csv_ = path; }

  /// JSON export destination (empty = no export).
  const std::string &export_json() const { return export_json_; }

  /// Set JSON export destination.
  void set_export_json(const std::string &path) { export_json_ = path; }

  /// Report groups without rewriting anything.
  bool dry_run() const { return dry_run_; }

  /// Enable or disable dry run mode.
  void set_dry_run(bool v) { dry_run_ = v; }

  /// Skip the confirmation prompt before rewriting.
  bool assume_yes() const { return assume_yes_; }

  /// Set the assume-yes flag.
  void set_assume_yes(bool v) { assume_yes_ = v; }

  /**
   * Load configuration from the file at `path`.
   *
   * @throws ConfigError When the file cannot be read or parsed, when its
   *         extension is unsupported, or when a value is invalid.
   */
  static Config from_file(const std::string &path);

  /// Build configuration from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /// Populate this configuration from a JSON object.
  void load_json(const nlohmann::json &j);

private:
  bool verbose_ = false;
  std::chrono::seconds squash_window_{kDefaultSquashWindow};
  std::chrono::seconds age_limit_{kDefaultSquashWindow};
  bool enable_age_filter_ = false;
  std::vector<std::string> boundary_keywords_{"revert", "merge", "pull"};
  bool treat_merge_commits_as_boundaries_ = true;
  std::string correlation_pattern_{kDefaultCorrelationPattern};
  AliasTable aliases_;
  std::string repository_path_ = ".";
  std::string remote_ = "origin";
  std::string git_executable_ = "git";
  std::chrono::seconds git_timeout_{30};
  std::vector<std::string> include_branches_;
  std::vector<std::string> exclude_branches_;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
  std::string history_db_ = ":memory:";
  std::string export_csv_;
  std::string export_json_;
  bool dry_run_ = false;
  bool assume_yes_ = false;
};

} // namespace agsq

#endif // AUTOGITSQUASH_CONFIG_HPP
