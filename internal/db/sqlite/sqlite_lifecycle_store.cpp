#include "sqlite_lifecycle_store.hpp"

#include <mutex>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace danmaku::db::sqlite {

using danmaku::model::LifecycleStatus;
using danmaku::observability::BoolField;
using danmaku::observability::IntField;
using danmaku::observability::StringField;

namespace {

// Serializes schema creation between store instances of this process.
std::mutex g_bootstrap_mutex;

LifecycleStatus ToStatus(int value) {
  switch (value) {
    case 1:
      return LifecycleStatus::kVerified;
    case 2:
      return LifecycleStatus::kLost;
    default:
      return LifecycleStatus::kPending;
  }
}

void LogFailure(const char* op, const Result& r) {
  DANMAKU_LOG_ERROR("lifecycle store operation failed", {StringField("op", op), StringField("code", ToString(r.code)),
                                                         BoolField("transient", r.IsTransient()), StringField("error", r.message)});
}

} // namespace

SqliteLifecycleStore::SqliteLifecycleStore(std::string path) : path_(std::move(path)) {
  BootstrapSchema();
}

std::unique_ptr<SqliteDB> SqliteLifecycleStore::Open() const {
  return std::make_unique<SqliteDB>(path_);
}

void SqliteLifecycleStore::BootstrapSchema() {
  std::lock_guard lock(g_bootstrap_mutex);

  auto db = Open();
  db->Exec(sql::CREATE_SENT_DANMAKU);
  db->Exec(sql::CREATE_SENT_DANMAKU_INDEX);
  db->Exec("SELECT dmid,cid,bvid,content,progress,mode,font_size,color,send_time_ms,is_visible,status FROM sent_danmaku LIMIT 1;");
  DANMAKU_LOG_DEBUG("lifecycle store ready", {StringField("path", path_)});
}

Result SqliteLifecycleStore::LoadLiveIds(SqliteDB& db, const std::vector<std::string>& dmids) {
  db.Exec(sql::CREATE_LIVE_IDS);
  db.Exec("DELETE FROM temp.live_dmid;");

  auto st = db.Prepare(sql::INSERT_LIVE_ID);
  for (const auto& id : dmids) {
    if (id.empty()) continue;

    BindText(st.get(), 1, id);
    int  rc = sqlite3_step(st.get());
    auto r  = db.StatusOf(rc);
    if (!r) return r;
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
  }
  return Result::Ok();
}

model::LifecycleRecord SqliteLifecycleStore::ReadRecord(sqlite3_stmt* st) {
  model::LifecycleRecord r;
  r.dmid         = ColumnText(st, 0);
  r.cid          = ColumnInt64(st, 1);
  r.bvid         = ColumnText(st, 2);
  r.content      = ColumnText(st, 3);
  r.progress_ms  = ColumnInt64(st, 4);
  r.mode         = static_cast<int>(ColumnInt64(st, 5));
  r.font_size    = static_cast<int>(ColumnInt64(st, 6));
  r.color        = static_cast<uint32_t>(ColumnInt64(st, 7));
  r.send_time_ms = static_cast<uint64_t>(ColumnInt64(st, 8));
  r.is_visible   = ColumnInt64(st, 9) != 0;
  r.status       = ToStatus(static_cast<int>(ColumnInt64(st, 10)));
  return r;
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

void SqliteLifecycleStore::RecordAccepted(const danmaku::model::VideoTarget& target, const danmaku::model::Danmaku& dm,
                                          bool is_visible) {
  if (dm.dmid.empty()) {
    DANMAKU_LOG_WARN("refusing to record danmaku without dmid", {StringField("msg", dm.msg)});
    return;
  }

  try {
    auto          db = Open();
    SqliteWriteTx tx(*db);

    auto st = db->Prepare(sql::INSERT_ACCEPTED);
    BindText(st.get(), 1, dm.dmid);
    BindInt64(st.get(), 2, target.cid);
    BindText(st.get(), 3, target.bvid);
    BindText(st.get(), 4, dm.msg);
    BindInt64(st.get(), 5, dm.progress_ms);
    BindInt64(st.get(), 6, dm.mode);
    BindInt64(st.get(), 7, dm.font_size);
    BindInt64(st.get(), 8, static_cast<int64_t>(dm.color));
    BindInt64(st.get(), 9, static_cast<int64_t>(util::ToUnixMillis(util::Now())));
    BindInt64(st.get(), 10, is_visible ? 1 : 0);

    auto r = db->StatusOf(sqlite3_step(st.get()));
    if (!r) {
      LogFailure("record_accepted", r);
      return;
    }
    const bool inserted = db->Changes() > 0;
    st.reset();
    tx.Commit();

    if (inserted) {
      DANMAKU_LOG_DEBUG("danmaku recorded", {StringField("dmid", dm.dmid), IntField("cid", target.cid)});
    } else {
      DANMAKU_LOG_DEBUG("danmaku already recorded", {StringField("dmid", dm.dmid)});
    }
  } catch (const std::exception& e) {
    LogFailure("record_accepted", Result::Err(ErrorCode::InternalError, e.what()));
  }
}

std::size_t SqliteLifecycleStore::Verify(const std::vector<std::string>& dmids) {
  if (dmids.empty()) {
    return 0;
  }

  try {
    auto          db = Open();
    SqliteWriteTx tx(*db);

    auto r = LoadLiveIds(*db, dmids);
    if (!r) {
      LogFailure("verify", r);
      return 0;
    }

    auto st = db->Prepare(sql::VERIFY_LIVE);
    r       = db->StatusOf(sqlite3_step(st.get()));
    if (!r) {
      LogFailure("verify", r);
      return 0;
    }
    const auto changed = db->Changes();
    st.reset();
    tx.Commit();

    if (changed > 0) {
      DANMAKU_LOG_INFO("verified surviving danmaku", {IntField("count", static_cast<int64_t>(changed))});
    }
    return changed;
  } catch (const std::exception& e) {
    LogFailure("verify", Result::Err(ErrorCode::InternalError, e.what()));
    return 0;
  }
}

std::size_t SqliteLifecycleStore::MarkLost(int64_t cid, const std::vector<std::string>& live_dmids) {
  try {
    auto          db = Open();
    SqliteWriteTx tx(*db);

    Statement st;
    if (live_dmids.empty()) {
      // provider returned nothing: none of the pending ones are visible
      st = db->Prepare(sql::MARK_ALL_PENDING_LOST);
    } else {
      auto r = LoadLiveIds(*db, live_dmids);
      if (!r) {
        LogFailure("mark_lost", r);
        return 0;
      }
      st = db->Prepare(sql::MARK_LOST_EXCEPT_LIVE);
    }
    BindInt64(st.get(), 1, cid);

    auto r = db->StatusOf(sqlite3_step(st.get()));
    if (!r) {
      LogFailure("mark_lost", r);
      return 0;
    }
    const auto changed = db->Changes();
    st.reset();
    tx.Commit();

    if (changed > 0) {
      DANMAKU_LOG_WARN("danmaku marked as lost", {IntField("cid", cid), IntField("count", static_cast<int64_t>(changed))});
    }
    return changed;
  } catch (const std::exception& e) {
    LogFailure("mark_lost", Result::Err(ErrorCode::InternalError, e.what()));
    return 0;
  }
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::size_t SqliteLifecycleStore::CountMatching(const danmaku::model::VideoTarget& target,
                                                const danmaku::model::Danmaku& dm) {
  try {
    auto db = Open();
    auto st = db->Prepare(sql::COUNT_MATCHING);
    BindInt64(st.get(), 1, target.cid);
    BindText(st.get(), 2, target.bvid);
    BindText(st.get(), 3, dm.msg);
    BindInt64(st.get(), 4, dm.progress_ms);
    BindInt64(st.get(), 5, dm.mode);
    BindInt64(st.get(), 6, dm.font_size);
    BindInt64(st.get(), 7, static_cast<int64_t>(dm.color));

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) {
      LogFailure("count_matching", db->StatusOf(rc));
      return 0;
    }
    return static_cast<std::size_t>(ColumnInt64(st.get(), 0));
  } catch (const std::exception& e) {
    LogFailure("count_matching", Result::Err(ErrorCode::InternalError, e.what()));
    return 0;
  }
}

model::LifecycleStats SqliteLifecycleStore::GetStats(int64_t cid) {
  model::LifecycleStats stats;
  try {
    auto db = Open();
    auto st = db->Prepare(sql::SELECT_STATS);
    BindInt64(st.get(), 1, cid);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) {
      LogFailure("get_stats", db->StatusOf(rc));
      return stats;
    }
    stats.total    = static_cast<uint64_t>(ColumnInt64(st.get(), 0));
    stats.verified = static_cast<uint64_t>(ColumnInt64(st.get(), 1));
    stats.lost     = static_cast<uint64_t>(ColumnInt64(st.get(), 2));
  } catch (const std::exception& e) {
    LogFailure("get_stats", Result::Err(ErrorCode::InternalError, e.what()));
  }
  return stats;
}

std::vector<model::LifecycleRecord> SqliteLifecycleStore::QueryHistory(const model::HistoryQuery& query) {
  std::vector<model::LifecycleRecord> out;
  try {
    auto db = Open();
    auto st = db->Prepare(sql::SELECT_HISTORY);
    BindText(st.get(), 1, query.keyword);
    BindInt64(st.get(), 2, query.status ? static_cast<int>(*query.status) : -1);
    BindInt64(st.get(), 3, static_cast<int64_t>(query.limit));

    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      out.push_back(ReadRecord(st.get()));
    }
    auto r = db->StatusOf(rc);
    if (!r) LogFailure("query_history", r);
  } catch (const std::exception& e) {
    LogFailure("query_history", Result::Err(ErrorCode::InternalError, e.what()));
  }
  return out;
}

std::vector<model::LifecycleRecord> SqliteLifecycleStore::GetPendingRecords(int64_t cid) {
  std::vector<model::LifecycleRecord> out;
  try {
    auto db = Open();
    auto st = db->Prepare(sql::SELECT_PENDING);
    BindInt64(st.get(), 1, cid);

    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      out.push_back(ReadRecord(st.get()));
    }
    auto r = db->StatusOf(rc);
    if (!r) LogFailure("get_pending_records", r);
  } catch (const std::exception& e) {
    LogFailure("get_pending_records", Result::Err(ErrorCode::InternalError, e.what()));
  }
  return out;
}

std::optional<model::LifecycleRecord> SqliteLifecycleStore::Get(const std::string& dmid) {
  try {
    auto db = Open();
    auto st = db->Prepare(sql::SELECT_BY_ID);
    BindText(st.get(), 1, dmid);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) {
      if (rc != SQLITE_DONE) LogFailure("get", db->StatusOf(rc));
      return std::nullopt;
    }
    return ReadRecord(st.get());
  } catch (const std::exception& e) {
    LogFailure("get", Result::Err(ErrorCode::InternalError, e.what()));
    return std::nullopt;
  }
}

} // namespace danmaku::db::sqlite
