#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

namespace fs = std::filesystem;

constexpr const char *kRootLogger = "agsq";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;

std::mutex g_logger_mutex;

/**
 * Path of rotation slot @p index for @p base (`squash.log` ->
 * `squash.2.log`). Index 0 is the live file.
 */
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  std::string stem = base_path.stem().string();
  std::string ext = base_path.extension().string();
  fs::path name = stem + "." + std::to_string(index) + ext;
  return base_path.has_parent_path() ? base_path.parent_path() / name : name;
}

/// Shift `<base>.N.gz` archives one slot up, dropping the oldest.
void shift_compressed_rotations(const std::string &base,
                                std::size_t max_files) {
  std::error_code ec;
  fs::remove(rotated_path(base, max_files).string() + ".gz", ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path from = rotated_path(base, i - 1).string() + ".gz";
    if (!fs::exists(from, ec)) {
      continue;
    }
    fs::path to = rotated_path(base, i).string() + ".gz";
    fs::remove(to, ec);
    fs::rename(from, to, ec);
  }
}

/**
 * Gzip @p path into `<path>.gz` and remove the original.
 *
 * @return `true` when the archive was written completely.
 */
bool gzip_file(const std::string &path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return false;
  }
  const std::string target = path + ".gz";
  gzFile gz = gzopen(target.c_str(), "wb");
  if (!gz) {
    return false;
  }
  char buffer[16 * 1024];
  bool ok = true;
  while (input && ok) {
    input.read(buffer, sizeof(buffer));
    std::streamsize got = input.gcount();
    if (got > 0 &&
        gzwrite(gz, buffer, static_cast<unsigned>(got)) != got) {
      ok = false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  if (!ok) {
    fs::remove(target, ec);
    return false;
  }
  fs::remove(path, ec);
  return true;
}

std::vector<spdlog::sink_ptr> make_sinks(const std::string &file,
                                         std::size_t rotate_files,
                                         bool compress_rotations) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (file.empty()) {
    return sinks;
  }
  if (rotate_files == 0) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
    return sinks;
  }
  spdlog::file_event_handlers handlers;
  if (compress_rotations) {
    handlers.before_open = [rotate_files](const spdlog::filename_t &name) {
      const auto base = spdlog::details::os::filename_to_str(name);
      shift_compressed_rotations(base, rotate_files);
      fs::path newest = rotated_path(base, 1);
      std::error_code ec;
      if (fs::exists(newest, ec)) {
        gzip_file(newest.string());
      }
    };
  }
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file, kMaxLogFileSize, rotate_files, false, handlers));
  return sinks;
}

std::shared_ptr<spdlog::logger> make_logger(const std::string &name,
                                            std::vector<spdlog::sink_ptr> sinks,
                                            spdlog::level::level_enum level) {
  auto logger =
      std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

} // namespace

namespace agsq {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto sinks = make_sinks(file, rotate_files, compress_rotations);
  auto root = spdlog::get(kRootLogger);
  if (root) {
    root->sinks() = sinks;
    root->set_level(level);
  } else {
    root = make_logger(kRootLogger, sinks, level);
    spdlog::register_logger(root);
  }
  spdlog::set_default_logger(root);
  // Categories created before configuration was read follow the new sinks.
  spdlog::apply_all([&](const std::shared_ptr<spdlog::logger> &logger) {
    if (logger != root) {
      logger->sinks() = sinks;
      logger->set_level(level);
    }
  });
  lock.unlock();
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  root->debug("Logger initialised (level={}, file='{}', rotate={}, "
              "compress={})",
              spdlog::level::to_string_view(level), file, rotate_files,
              compress_rotations ? "true" : "false");
}

void ensure_default_logger() {
  if (!spdlog::get(kRootLogger)) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_default_logger();
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  const std::string name = std::string(kRootLogger) + "." + category;
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto root = spdlog::get(kRootLogger);
  auto logger = make_logger(name, root->sinks(), root->level());
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->debug("Applied {} log category override(s)",
                                      overrides.size());
  }
}

} // namespace agsq
