#pragma once

#include <memory>
#include <string>

#include "internal/db/api/lifecycle_store.hpp"
#include "internal/db/api/result.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace danmaku::db::sqlite {

/*
  LifecycleStore on a single SQLite file.

  Each operation opens its own connection and transaction, so the sender
  and the monitor can share one instance (or one file) across threads.
*/
class SqliteLifecycleStore final : public db::LifecycleStore {
public:
  // Creates the file and schema if needed. Throws if the file cannot be opened.
  explicit SqliteLifecycleStore(std::string path);

  const std::string& Path() const { return path_; }

  void RecordAccepted(const danmaku::model::VideoTarget& target, const danmaku::model::Danmaku& dm,
                      bool is_visible) override;
  std::size_t Verify(const std::vector<std::string>& dmids) override;
  std::size_t MarkLost(int64_t cid, const std::vector<std::string>& live_dmids) override;
  std::size_t CountMatching(const danmaku::model::VideoTarget& target, const danmaku::model::Danmaku& dm) override;
  model::LifecycleStats GetStats(int64_t cid) override;
  std::vector<model::LifecycleRecord> QueryHistory(const model::HistoryQuery& query) override;
  std::vector<model::LifecycleRecord> GetPendingRecords(int64_t cid) override;
  std::optional<model::LifecycleRecord> Get(const std::string& dmid) override;

private:
  std::unique_ptr<SqliteDB> Open() const;
  void BootstrapSchema();

  static Result LoadLiveIds(SqliteDB& db, const std::vector<std::string>& dmids);
  static model::LifecycleRecord ReadRecord(sqlite3_stmt* st);

  std::string path_;
};

}
