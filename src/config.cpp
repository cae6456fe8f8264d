#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace agsq {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// Interpret a YAML scalar as a number when the whole string parses as one.
nlohmann::json yaml_scalar_to_json(const std::string &s) {
  if (s == "true" || s == "True" || s == "TRUE")
    return true;
  if (s == "false" || s == "False" || s == "FALSE")
    return false;
  if (s.empty())
    return s;
  const char *begin = s.c_str();
  char *end = nullptr;
  errno = 0;
  long long i = std::strtoll(begin, &end, 10);
  if (errno == 0 && end == begin + s.size())
    return i;
  errno = 0;
  double d = std::strtod(begin, &end);
  if (errno == 0 && end == begin + s.size())
    return d;
  return s;
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar:
    // Quoted scalars stay strings so "0123" style values survive.
    if (node.Tag() == "!") {
      return node.Scalar();
    }
    return yaml_scalar_to_json(node.Scalar());
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  auto stringify_temporal = [](const auto &temporal) {
    std::ostringstream oss;
    oss << temporal;
    return oss.str();
  };

  if (const auto *value = node.as_date())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_time())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_date_time())
    return stringify_temporal(value->get());

  return nullptr;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * configuration files expose the same flat keys that the loader expects.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section :
       {"squash", "identity", "repository", "logging", "artifacts",
        "workflow"}) {
    merge_section(section);
  }

  return normalized;
}

/// Accept either whole seconds or a duration string.
std::chrono::seconds read_duration(const nlohmann::json &value,
                                   std::string_view key) {
  if (value.is_number_integer()) {
    return std::chrono::seconds(value.get<long long>());
  }
  if (value.is_string()) {
    try {
      return parse_duration(value.get<std::string>());
    } catch (const std::runtime_error &e) {
      throw ConfigError("Invalid " + std::string(key) + " '" +
                        value.get<std::string>() + "': " + e.what());
    }
  }
  throw ConfigError(std::string(key) +
                    " must be a number of seconds or a duration string");
}

std::vector<std::string> read_identifiers(const nlohmann::json &value,
                                          const std::string &canonical) {
  if (value.is_string()) {
    return {value.get<std::string>()};
  }
  if (value.is_array()) {
    std::vector<std::string> ids;
    for (const auto &item : value) {
      if (!item.is_string()) {
        throw ConfigError("Alias identifiers for '" + canonical +
                          "' must be strings");
      }
      ids.push_back(item.get<std::string>());
    }
    return ids;
  }
  throw ConfigError("Alias identifiers for '" + canonical +
                    "' must be a string or a list of strings");
}

/**
 * Parse the `aliases` value. Two layouts are accepted:
 * a list of `{canonical, identifiers}` objects, or an object mapping each
 * canonical identity to its identifiers.
 */
std::vector<AliasEntry> parse_aliases(const nlohmann::json &value) {
  std::vector<AliasEntry> entries;
  if (value.is_null()) {
    return entries;
  }
  if (value.is_object()) {
    for (const auto &[canonical, ids] : value.items()) {
      entries.push_back({canonical, read_identifiers(ids, canonical)});
    }
    return entries;
  }
  if (!value.is_array()) {
    throw ConfigError("aliases must be a list or a mapping");
  }
  for (const auto &item : value) {
    if (!item.is_object() || !item.contains("canonical") ||
        !item["canonical"].is_string()) {
      throw ConfigError("Each alias entry needs a string 'canonical' field");
    }
    AliasEntry entry;
    entry.canonical = item["canonical"].get<std::string>();
    if (item.contains("identifiers")) {
      entry.identifiers = read_identifiers(item["identifiers"], entry.canonical);
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::unordered_map<std::string, std::string>
parse_log_categories(const nlohmann::json &value) {
  std::unordered_map<std::string, std::string> categories;
  auto assign_category = [&categories](std::string name, std::string level) {
    if (name.empty()) {
      return;
    }
    if (level.empty()) {
      level = "debug";
    }
    categories[std::move(name)] = std::move(level);
  };
  auto assign_raw = [&assign_category](const std::string &raw) {
    auto pos = raw.find('=');
    assign_category(pos == std::string::npos ? raw : raw.substr(0, pos),
                    pos == std::string::npos ? std::string{"debug"}
                                             : raw.substr(pos + 1));
  };
  if (value.is_object()) {
    for (const auto &[key, v] : value.items()) {
      if (v.is_string()) {
        assign_category(key, v.get<std::string>());
      } else if (v.is_null()) {
        assign_category(key, "debug");
      } else {
        config_log()->warn("Unsupported value for log category '{}'; "
                           "expected string or null",
                           key);
      }
    }
  } else if (value.is_array()) {
    for (const auto &item : value) {
      if (item.is_string()) {
        assign_raw(item.get<std::string>());
      }
    }
  } else if (value.is_string()) {
    assign_raw(value.get<std::string>());
  }
  return categories;
}

} // namespace

void Config::set_squash_window(std::chrono::seconds window) {
  if (window.count() < 0) {
    throw ConfigError("squash_window must not be negative");
  }
  squash_window_ = window;
}

void Config::set_age_limit(std::chrono::seconds limit) {
  if (limit.count() < 0) {
    throw ConfigError("age_limit must not be negative");
  }
  age_limit_ = limit;
}

void Config::set_git_timeout(std::chrono::seconds timeout) {
  if (timeout.count() < 1) {
    throw ConfigError("git_timeout must be at least one second");
  }
  git_timeout_ = timeout;
}

void Config::set_correlation_pattern(const std::string &pattern) {
  try {
    std::regex compiled(pattern);
    (void)compiled;
  } catch (const std::regex_error &e) {
    throw ConfigError("Invalid correlation_pattern '" + pattern +
                      "': " + e.what());
  }
  correlation_pattern_ = pattern;
}

void Config::set_aliases(const std::vector<AliasEntry> &entries) {
  aliases_ = AliasTable::from_entries(entries);
}

void Config::load_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw ConfigError("Configuration root must be a mapping");
  }
  nlohmann::json cfg = normalize_config_sections(j);

  try {
    if (cfg.contains("verbose")) {
      set_verbose(cfg["verbose"].get<bool>());
    }
    if (cfg.contains("squash_window")) {
      set_squash_window(read_duration(cfg["squash_window"], "squash_window"));
    }
    if (cfg.contains("age_limit")) {
      set_age_limit(read_duration(cfg["age_limit"], "age_limit"));
    }
    if (cfg.contains("enable_age_filter")) {
      set_enable_age_filter(cfg["enable_age_filter"].get<bool>());
    }
    if (cfg.contains("boundary_keywords")) {
      set_boundary_keywords(
          cfg["boundary_keywords"].get<std::vector<std::string>>());
    }
    if (cfg.contains("treat_merge_commits_as_boundaries")) {
      set_treat_merge_commits_as_boundaries(
          cfg["treat_merge_commits_as_boundaries"].get<bool>());
    }
    if (cfg.contains("correlation_pattern")) {
      set_correlation_pattern(cfg["correlation_pattern"].get<std::string>());
    }
    if (cfg.contains("aliases")) {
      set_aliases(parse_aliases(cfg["aliases"]));
    }
    if (cfg.contains("repository_path")) {
      set_repository_path(cfg["repository_path"].get<std::string>());
    }
    if (cfg.contains("remote")) {
      set_remote(cfg["remote"].get<std::string>());
    }
    if (cfg.contains("git_executable")) {
      set_git_executable(cfg["git_executable"].get<std::string>());
    }
    if (cfg.contains("git_timeout")) {
      set_git_timeout(read_duration(cfg["git_timeout"], "git_timeout"));
    }
    if (cfg.contains("include_branches")) {
      set_include_branches(
          cfg["include_branches"].get<std::vector<std::string>>());
    }
    if (cfg.contains("exclude_branches")) {
      set_exclude_branches(
          cfg["exclude_branches"].get<std::vector<std::string>>());
    }
    if (cfg.contains("log_level")) {
      set_log_level(cfg["log_level"].get<std::string>());
    }
    if (cfg.contains("log_pattern")) {
      set_log_pattern(cfg["log_pattern"].get<std::string>());
    }
    if (cfg.contains("log_file")) {
      set_log_file(cfg["log_file"].get<std::string>());
    }
    if (cfg.contains("log_rotate")) {
      set_log_rotate(cfg["log_rotate"].get<int>());
    }
    if (cfg.contains("log_compress")) {
      set_log_compress(cfg["log_compress"].get<bool>());
    }
    if (cfg.contains("log_categories")) {
      set_log_categories(parse_log_categories(cfg["log_categories"]));
    }
    if (cfg.contains("history_db")) {
      set_history_db(cfg["history_db"].get<std::string>());
    }
    if (cfg.contains("export_csv")) {
      set_export_csv(cfg["export_csv"].get<std::string>());
    }
    if (cfg.contains("export_json")) {
      set_export_json(cfg["export_json"].get<std::string>());
    }
    if (cfg.contains("dry_run")) {
      set_dry_run(cfg["dry_run"].get<bool>());
    }
    if (cfg.contains("assume_yes")) {
      set_assume_yes(cfg["assume_yes"].get<bool>());
    }
  } catch (const nlohmann::json::exception &e) {
    config_log()->error("Invalid configuration value: {}", e.what());
    throw ConfigError(std::string("Invalid configuration value: ") + e.what());
  }
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown as ConfigError.
 *
 * @param path Filesystem location of the configuration file.
 * @return Fully populated configuration object.
 */
Config Config::from_file(const std::string &path) {
  ensure_default_logger();
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw ConfigError("Unknown config file extension: " + path);
  }
  std::string ext = path.substr(pos + 1);
  std::string ext_lower = to_lower_copy(ext);
  config_log()->debug("Detected config file type: {}", ext_lower);
  nlohmann::json j;
  if (ext_lower == "yaml" || ext_lower == "yml") {
    try {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } catch (const YAML::Exception &e) {
      config_log()->error("Failed to load config {}: {}", path, e.what());
      throw ConfigError("Failed to load config " + path + ": " + e.what());
    }
  } else if (ext_lower == "json") {
    std::ifstream f(path);
    if (!f) {
      config_log()->error("Failed to open config file {}", path);
      throw ConfigError("Failed to open config file " + path);
    }
    try {
      f >> j;
    } catch (const nlohmann::json::exception &e) {
      config_log()->error("Failed to load config {}: {}", path, e.what());
      throw ConfigError("Failed to load config " + path + ": " + e.what());
    }
  } else if (ext_lower == "toml" || ext_lower == "tml") {
    try {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } catch (const toml::parse_error &e) {
      config_log()->error("Failed to load config {}: {}", path, e.what());
      throw ConfigError("Failed to load config " + path + ": " + e.what());
    }
  } else {
    config_log()->error("Unsupported config format: {}", ext);
    throw ConfigError("Unsupported config format: " + ext);
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace agsq
