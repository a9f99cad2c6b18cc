#include "sqlite_db.hpp"

#include <stdexcept>

namespace danmaku::db::sqlite {

namespace {

constexpr int kOpenFlags   = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
constexpr int kBusyWaitMs  = 5000;

// Applied to every new connection. busy_timeout goes first so the
// journal_mode switch also waits on a locked file.
constexpr const char* kConnectionPragmas =
    "PRAGMA journal_mode=WAL;"
    "PRAGMA synchronous=NORMAL;"
    "PRAGMA temp_store=MEMORY;";

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  if (sqlite3_open_v2(path_.c_str(), &db_, kOpenFlags, nullptr) != SQLITE_OK) {
    const std::string msg = "cannot open " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    if (sqlite3_busy_timeout(db_, kBusyWaitMs) != SQLITE_OK) {
      throw std::runtime_error(std::string("busy_timeout: ") + sqlite3_errmsg(db_));
    }
    Exec(kConnectionPragmas);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error(path_ + ": " + msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db_));
  }
  return Statement(stmt);
}

Result SqliteDB::StatusOf(int rc) const {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  // extended codes keep the primary code in the low byte
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db_));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db_));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db_));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db_));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db_));
  }
}

void BindText(sqlite3_stmt* st, int idx, const std::string& value) {
  sqlite3_bind_text(st, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void BindInt64(sqlite3_stmt* st, int idx, int64_t value) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(value));
}

std::string ColumnText(sqlite3_stmt* st, int col) {
  const auto* text = sqlite3_column_text(st, col);
  if (!text) return {};
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
}

int64_t ColumnInt64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

} // namespace danmaku::db::sqlite
