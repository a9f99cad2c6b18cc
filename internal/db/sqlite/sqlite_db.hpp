#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/result.hpp"

namespace danmaku::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  One short-lived connection to the history file.

  Opened per store operation and never shared between threads, so the
  handle is opened without sqlite's own serialization.
*/
class SqliteDB {
 public:
  // Throws std::runtime_error when the file cannot be opened or configured.
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  void      Exec(const std::string& sql);
  Statement Prepare(const std::string& sql);

  // Rows touched by the last INSERT/UPDATE on this connection.
  std::size_t Changes() const {
    return static_cast<std::size_t>(sqlite3_changes(db_));
  }

  // Maps a sqlite3_step/exec return code; ROW and DONE count as success.
  Result StatusOf(int rc) const;

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& value);
void BindInt64(sqlite3_stmt* st, int idx, int64_t value);

std::string ColumnText(sqlite3_stmt* st, int col);
int64_t     ColumnInt64(sqlite3_stmt* st, int col);

} // namespace danmaku::db::sqlite
