#include "app.hpp"
#include "errors.hpp"
#include "git_cli_backend.hpp"
#include "log.hpp"
#include "repository_session.hpp"

#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <utility>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    agsq::ensure_default_logger();
    return agsq::category_logger("main");
  }();
  return logger;
}
} // namespace

/**
 * Program entry point: resolve settings, open the repository and squash.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Zero when every branch was processed, one otherwise.
 */
int main(int argc, char **argv) {
  agsq::App app;
  int ret = app.run(argc, argv);
  if (ret != 0 || app.should_exit()) {
    return ret;
  }

  const auto &cfg = app.config();
  agsq::GitCliOptions git_options;
  git_options.repository_path = cfg.repository_path();
  git_options.remote = cfg.remote();
  git_options.git_executable = cfg.git_executable();
  git_options.timeout = cfg.git_timeout();

  try {
    agsq::RepositorySession session(
        std::make_unique<agsq::GitCliBackend>(std::move(git_options)));
    return app.squash(session.backend());
  } catch (const std::exception &e) {
    main_log()->error("Terminated due to an error: {}", e.what());
    return 1;
  }
}
