#pragma once

#include "sqlite_db.hpp"

namespace danmaku::db::sqlite {

/*
  Write scope on one connection.

  BEGIN IMMEDIATE takes the write lock up front, so two writers wait on
  busy_timeout instead of failing a lock upgrade halfway through. Rolled
  back on destruction unless Commit() ran.
*/
class SqliteWriteTx {
public:
  explicit SqliteWriteTx(SqliteDB& db);
  ~SqliteWriteTx();

  SqliteWriteTx(const SqliteWriteTx&)            = delete;
  SqliteWriteTx& operator=(const SqliteWriteTx&) = delete;

  void Commit();

private:
  SqliteDB& db_;
  bool      open_ = true;
};

}
