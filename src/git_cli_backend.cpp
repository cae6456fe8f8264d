/**
 * @file git_cli_backend.cpp
 * @brief Implements GitBackend by invoking git subcommands.
 *
 * Commit metadata is requested with a machine-readable record format so that
 * parsing never depends on spaces inside author names.
 */
#include "git_cli_backend.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <utility>

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace agsq {

namespace {

constexpr char kFieldSep = '\x1f';
constexpr char kRecordSep = '\x1e';
constexpr const char *kLogFormat = "--format=%H%x1f%an%x1f%ae%x1f%ct%x1f%P%x1e";

std::shared_ptr<spdlog::logger> git_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("git");
  }();
  return logger;
}

std::string trim(const std::string &s) {
  auto first = std::find_if_not(
      s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  if (first == s.end())
    return {};
  auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  return std::string(first, last);
}

std::string rtrim_newlines(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
    s.pop_back();
  }
  return s;
}

std::vector<std::string> split(const std::string &s, char sep) {
  std::vector<std::string> parts;
  std::string current;
  std::istringstream in(s);
  while (std::getline(in, current, sep)) {
    parts.push_back(current);
  }
  if (!s.empty() && s.back() == sep) {
    parts.emplace_back();
  }
  return parts;
}

std::vector<std::string> non_empty_lines(const std::string &s) {
  std::vector<std::string> lines;
  for (auto &line : split(s, '\n')) {
    line = trim(line);
    if (!line.empty()) {
      lines.push_back(std::move(line));
    }
  }
  return lines;
}

/// Temporary file holding a commit message, removed on destruction.
class MessageFile {
public:
  explicit MessageFile(const std::string &content) {
    auto dir = std::filesystem::temp_directory_path().string();
    std::string pattern = dir + "/agsq-msg-XXXXXX";
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    int fd = ::mkstemp(buf.data());
    if (fd < 0) {
      throw BackendCommandFailure("mkstemp", -1, std::strerror(errno));
    }
    ::close(fd);
    path_ = buf.data();
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    out << content;
    if (!out) {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
      throw BackendCommandFailure("write " + path_, -1,
                                  "failed to write commit message");
    }
  }
  ~MessageFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  MessageFile(const MessageFile &) = delete;
  MessageFile &operator=(const MessageFile &) = delete;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

} // namespace

GitCliBackend::GitCliBackend(GitCliOptions options,
                             std::unique_ptr<CommandRunner> runner)
    : options_(std::move(options)), runner_(std::move(runner)) {
  if (!runner_) {
    runner_ = std::make_unique<ProcessRunner>();
  }
}

CommandResult GitCliBackend::git_unchecked(
    const std::vector<std::string> &args,
    const std::vector<std::pair<std::string, std::string>> &env) {
  CommandSpec spec;
  spec.args.reserve(args.size() + 1);
  spec.args.push_back(options_.git_executable);
  spec.args.insert(spec.args.end(), args.begin(), args.end());
  spec.cwd = options_.repository_path;
  spec.env = {{"GIT_TERMINAL_PROMPT", "0"}, {"GIT_EDITOR", "true"}};
  spec.env.insert(spec.env.end(), env.begin(), env.end());
  spec.timeout = options_.timeout;
  return runner_->run(spec);
}

std::string
GitCliBackend::git(const std::vector<std::string> &args,
                   const std::vector<std::pair<std::string, std::string>> &env) {
  auto result = git_unchecked(args, env);
  if (result.exit_code != 0) {
    std::vector<std::string> argv{options_.git_executable};
    argv.insert(argv.end(), args.begin(), args.end());
    auto label = describe_command(argv);
    git_log()->error("git command failed ({}): {}", result.exit_code, label);
    throw BackendCommandFailure(label, result.exit_code, trim(result.err));
  }
  return result.out;
}

std::vector<std::string> GitCliBackend::list_remote_branches() {
  const std::string prefix = "refs/remotes/" + options_.remote + "/";
  auto out = git({"for-each-ref", "--format=%(refname)%09%(symref)",
                  "refs/remotes/" + options_.remote});
  std::vector<std::string> branches;
  for (const auto &line : non_empty_lines(out)) {
    auto tab = line.find('\t');
    std::string ref = tab == std::string::npos ? line : line.substr(0, tab);
    bool symbolic = tab != std::string::npos && tab + 1 < line.size();
    if (symbolic || ref.rfind(prefix, 0) != 0) {
      continue;
    }
    std::string name = ref.substr(prefix.size());
    if (name.empty() || name == "HEAD") {
      continue;
    }
    branches.push_back(std::move(name));
  }
  git_log()->debug("Remote '{}' has {} branch(es)", options_.remote,
                   branches.size());
  return branches;
}

void GitCliBackend::checkout(const std::string &branch) {
  auto local = git_unchecked(
      {"rev-parse", "--verify", "--quiet", "refs/heads/" + branch});
  if (local.exit_code == 0) {
    git({"checkout", "--quiet", branch});
  } else {
    git({"checkout", "--quiet", "-b", branch, "--track",
         options_.remote + "/" + branch});
  }
  git_log()->debug("Checked out {}", branch);
}

std::vector<CommitRecord> GitCliBackend::list_commits(const std::string &branch) {
  // First-parent order keeps the list a true parent/child chain. Side
  // history joins it through merge commits and leaves it at commits with
  // side children; a group never extends past either.
  const std::string ref = "refs/heads/" + branch;
  auto records = parse_log_records(
      git({"log", "--first-parent", "--reverse", kLogFormat, ref}));
  mark_side_children(records, git({"rev-list", "--children", ref}));
  return records;
}

void GitCliBackend::mark_side_children(std::vector<CommitRecord> &records,
                                       const std::string &children_listing) {
  std::unordered_map<std::string, std::vector<std::string>> children;
  for (const auto &line : non_empty_lines(children_listing)) {
    auto tokens = split(trim(line), ' ');
    if (tokens.empty() || tokens[0].empty()) {
      continue;
    }
    auto &kids = children[tokens[0]];
    for (std::size_t i = 1; i < tokens.size(); ++i) {
      if (!tokens[i].empty()) {
        kids.push_back(tokens[i]);
      }
    }
  }
  for (std::size_t i = 0; i < records.size(); ++i) {
    auto it = children.find(records[i].hash);
    if (it == children.end()) {
      continue;
    }
    const std::string *next =
        i + 1 < records.size() ? &records[i + 1].hash : nullptr;
    records[i].has_side_children =
        std::any_of(it->second.begin(), it->second.end(),
                    [next](const std::string &child) {
                      return next == nullptr || child != *next;
                    });
    if (records[i].has_side_children) {
      git_log()->debug("Side history forks at {}", records[i].hash);
    }
  }
}

std::vector<CommitRecord>
GitCliBackend::parse_log_records(const std::string &raw) {
  std::vector<CommitRecord> records;
  for (const auto &chunk : split(raw, kRecordSep)) {
    std::string record = trim(chunk);
    if (record.empty()) {
      continue;
    }
    auto fields = split(record, kFieldSep);
    if (fields.size() != 5) {
      throw MalformedCommitRecord("expected 5 fields in commit record, got " +
                                  std::to_string(fields.size()));
    }
    CommitRecord rec;
    rec.hash = trim(fields[0]);
    rec.author_name = fields[1];
    rec.author_email = fields[2];
    if (rec.hash.empty()) {
      throw MalformedCommitRecord("commit record without hash");
    }
    if (rec.author_name.empty() && rec.author_email.empty()) {
      throw MalformedCommitRecord("commit " + rec.hash +
                                  " has neither author name nor email");
    }
    const std::string ts = trim(fields[3]);
    auto [ptr, ec] =
        std::from_chars(ts.data(), ts.data() + ts.size(), rec.commit_time);
    if (ts.empty() || ec != std::errc() || ptr != ts.data() + ts.size()) {
      throw MalformedCommitRecord("commit " + rec.hash +
                                  " has unparseable timestamp '" + ts + "'");
    }
    for (auto &parent : split(trim(fields[4]), ' ')) {
      if (!parent.empty()) {
        rec.parents.push_back(std::move(parent));
      }
    }
    records.push_back(std::move(rec));
  }
  return records;
}

std::string GitCliBackend::message(const std::string &hash) {
  return rtrim_newlines(git({"log", "-1", "--format=%B", hash}));
}

std::vector<std::string>
GitCliBackend::tags_containing(const std::string &hash) {
  return non_empty_lines(git({"tag", "--contains", hash}));
}

std::string GitCliBackend::head() { return trim(git({"rev-parse", "HEAD"})); }

void GitCliBackend::reset_to_ref(const std::string &ref) {
  git({"reset", "--quiet", "--hard", ref});
}

std::string GitCliBackend::build_collapsed_commit(const std::string &first,
                                                  const std::string &last,
                                                  const std::string &message) {
  const std::string tree = trim(git({"rev-parse", last + "^{tree}"}));
  auto first_parents =
      split(trim(git({"rev-list", "--parents", "-n", "1", first})), ' ');

  auto author = split(
      rtrim_newlines(git({"log", "-1", "--format=%an%x1f%ae%x1f%aI", last})),
      kFieldSep);
  if (author.size() != 3) {
    throw BackendCommandFailure("git log -1 " + last, 0,
                                "unexpected author format");
  }

  MessageFile msg(message);
  std::vector<std::string> args{"commit-tree", tree};
  // rev-list --parents prints the commit itself followed by its parents.
  for (std::size_t i = 1; i < first_parents.size(); ++i) {
    if (!first_parents[i].empty()) {
      args.push_back("-p");
      args.push_back(first_parents[i]);
    }
  }
  args.push_back("-F");
  args.push_back(msg.path());
  return trim(git(args, {{"GIT_AUTHOR_NAME", author[0]},
                         {"GIT_AUTHOR_EMAIL", author[1]},
                         {"GIT_AUTHOR_DATE", author[2]}}));
}

void GitCliBackend::restore(const std::string &saved_head) {
  auto abort = git_unchecked({"rebase", "--abort"});
  git_log()->debug("rebase --abort exited with {}", abort.exit_code);
  reset_to_ref(saved_head);
  git_log()->warn("Restored branch to {}", saved_head);
}

std::string GitCliBackend::collapse_range(const std::string &first,
                                          const std::string &last,
                                          const std::string &message) {
  const std::string saved = head();
  try {
    std::string collapsed = build_collapsed_commit(first, last, message);
    if (saved == last) {
      reset_to_ref(collapsed);
    } else {
      git({"rebase", "--quiet", "--rebase-merges", "--onto", collapsed, last});
    }
    git_log()->debug("Collapsed {}..{} into {}", first, last, collapsed);
    return collapsed;
  } catch (const BackendError &e) {
    git_log()->error("Collapse of {}..{} failed: {}", first, last, e.what());
    try {
      restore(saved);
    } catch (const BackendError &restore_error) {
      git_log()->critical("Could not restore {}: {}", saved,
                          restore_error.what());
    }
    throw;
  }
}

} // namespace agsq
