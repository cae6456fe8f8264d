/**
 * @file squash_history.cpp
 * @brief Implements persistent storage and export of squash results using
 * SQLite.
 */
#include "squash_history.hpp"
#include "log.hpp"

#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace agsq {

namespace {
std::shared_ptr<spdlog::logger> history_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("history");
  }();
  return logger;
}

/// Finalizes a prepared statement when leaving scope.
class Statement {
public:
  Statement(sqlite3 *db, const char *sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("Failed to prepare statement: ") +
                               sqlite3_errmsg(db));
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  sqlite3_stmt *get() const { return stmt_; }

private:
  sqlite3_stmt *stmt_ = nullptr;
};

std::string column_text(sqlite3_stmt *stmt, int col) {
  const unsigned char *text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char *>(text) : "";
}

std::string join_hashes(const std::vector<std::string> &hashes) {
  std::string out;
  for (const auto &h : hashes) {
    if (!out.empty()) {
      out += ' ';
    }
    out += h;
  }
  return out;
}

std::vector<std::string> split_hashes(const std::string &joined) {
  std::vector<std::string> out;
  std::istringstream in(joined);
  std::string h;
  while (in >> h) {
    out.push_back(h);
  }
  return out;
}

std::string escape_csv_field(std::string_view field) {
  bool needs_wrap = field.find(',') != std::string_view::npos ||
                    field.find('"') != std::string_view::npos ||
                    field.find('\n') != std::string_view::npos ||
                    field.find('\r') != std::string_view::npos;
  std::string escaped;
  escaped.reserve(field.size());
  for (char c : field) {
    if (c == '"') {
      escaped += "\"\"";
    } else {
      escaped += c;
    }
  }
  if (needs_wrap) {
    return std::string("\"") + escaped + "\"";
  }
  return escaped;
}

const char *kSelectAll = "SELECT branch,original_commits,original_author,"
                         "new_commit,message FROM squash_results ORDER BY id";
} // namespace

SquashHistory::SquashHistory(const std::string &db_path) {
  history_log()->debug("History: opening DB {}", db_path);
  if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to open database: " + msg);
  }
  const char *sql = "CREATE TABLE IF NOT EXISTS squash_results("
                    "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                    "branch TEXT, original_commits TEXT, original_author TEXT,"
                    "new_commit TEXT, message TEXT);";
  char *err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to create table: " + msg);
  }
  history_log()->debug("History: DB initialized");
}

SquashHistory::~SquashHistory() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void SquashHistory::record(const SquashResult &result) {
  Statement stmt(db_, "INSERT INTO squash_results(branch,original_commits,"
                      "original_author,new_commit,message) "
                      "VALUES(?,?,?,?,?)");
  const std::string commits = join_hashes(result.original_commits);
  sqlite3_bind_text(stmt.get(), 1, result.branch.c_str(), -1,
                    SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, commits.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, result.original_author.c_str(), -1,
                    SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, result.new_commit.c_str(), -1,
                    SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, result.message.c_str(), -1,
                    SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error("Failed to execute insert");
  }
}

std::vector<SquashResult> SquashHistory::results() {
  std::vector<SquashResult> out;
  Statement stmt(db_, kSelectAll);
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    SquashResult r;
    r.branch = column_text(stmt.get(), 0);
    r.original_commits = split_hashes(column_text(stmt.get(), 1));
    r.original_author = column_text(stmt.get(), 2);
    r.new_commit = column_text(stmt.get(), 3);
    r.message = column_text(stmt.get(), 4);
    out.push_back(std::move(r));
  }
  return out;
}

void SquashHistory::export_csv(const std::string &path) {
  history_log()->debug("History: export_csv -> {}", path);
  auto rows = results();
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to open CSV file");
  }
  out << "branch,original_commits,original_author,new_commit,message\n";
  for (const auto &r : rows) {
    out << escape_csv_field(r.branch) << ','
        << escape_csv_field(join_hashes(r.original_commits)) << ','
        << escape_csv_field(r.original_author) << ','
        << escape_csv_field(r.new_commit) << ',' << escape_csv_field(r.message)
        << '\n';
  }
  history_log()->debug("History: export_csv done");
}

void SquashHistory::export_json(const std::string &path) {
  history_log()->debug("History: export_json -> {}", path);
  nlohmann::json j = nlohmann::json::array();
  for (const auto &r : results()) {
    nlohmann::json item;
    item["branch"] = r.branch;
    item["original_commits"] = r.original_commits;
    item["original_author"] = r.original_author;
    item["new_commit"] = r.new_commit;
    item["message"] = r.message;
    j.push_back(item);
  }
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to open JSON file");
  }
  out << j.dump(2);
  history_log()->debug("History: export_json done");
}

} // namespace agsq
