/**
 * @file squash_history.hpp
 * @brief Ledger of performed squashes for autogitsquash.
 *
 * Declares the SquashHistory class for storing and exporting squash results
 * using SQLite.
 */

#ifndef AUTOGITSQUASH_SQUASH_HISTORY_HPP
#define AUTOGITSQUASH_SQUASH_HISTORY_HPP

#include "commit.hpp"

#include <sqlite3.h>
#include <string>
#include <vector>

namespace agsq {

/**
 * Simple RAII wrapper around SQLite recording every successful squash.
 *
 * The class manages opening, migrating, and closing the underlying database
 * connection while exposing a small surface for adding and exporting records.
 */
class SquashHistory {
public:
  /**
   * Construct and open the database at `db_path`.
   *
   * @param db_path Filesystem path to the SQLite database file to create or
   *        open, or `:memory:` for a ledger that lives only for this run.
   * @throws std::runtime_error When the database cannot be opened or migrated.
   */
  explicit SquashHistory(const std::string &db_path);

  /**
   * Destroy the wrapper and close the database connection if it is open.
   */
  ~SquashHistory();

  SquashHistory(const SquashHistory &) = delete;
  SquashHistory &operator=(const SquashHistory &) = delete;

  /**
   * Append one squash result.
   *
   * @throws std::runtime_error When the insert statement fails.
   */
  void record(const SquashResult &result);

  /// All stored results in insertion order.
  std::vector<SquashResult> results();

  /**
   * Export the ledger to a CSV file. Original commits are joined with
   * spaces in a single column.
   *
   * @throws std::runtime_error On I/O failures or when the query fails.
   */
  void export_csv(const std::string &path);

  /**
   * Export the ledger to a JSON array of objects.
   *
   * @throws std::runtime_error On I/O failures or when the query fails.
   */
  void export_json(const std::string &path);

private:
  sqlite3 *db_ = nullptr;
};

} // namespace agsq

#endif // AUTOGITSQUASH_SQUASH_HISTORY_HPP
