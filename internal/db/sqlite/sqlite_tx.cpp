#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace danmaku::db::sqlite {

SqliteWriteTx::SqliteWriteTx(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
}

SqliteWriteTx::~SqliteWriteTx() {
  if (!open_) return;

  // sqlite may already have rolled back on its own (e.g. SQLITE_FULL)
  if (sqlite3_get_autocommit(db_.Handle())) return;

  try {
    db_.Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    DANMAKU_LOG_WARN("history rollback failed", {danmaku::observability::StringField("error", e.what())});
  }
}

void SqliteWriteTx::Commit() {
  db_.Exec("COMMIT;");
  open_ = false;
}

} // namespace danmaku::db::sqlite
