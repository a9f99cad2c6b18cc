#pragma once

namespace danmaku::db::sql {

/*
  SQL used by the lifecycle store.

  status: 0 = pending, 1 = verified, 2 = lost
*/

static constexpr const char* CREATE_SENT_DANMAKU =
    "CREATE TABLE IF NOT EXISTS sent_danmaku ("
    " dmid TEXT PRIMARY KEY,"
    " cid INTEGER NOT NULL,"
    " bvid TEXT NOT NULL,"
    " content TEXT NOT NULL,"
    " progress INTEGER NOT NULL,"
    " mode INTEGER NOT NULL DEFAULT 1,"
    " font_size INTEGER NOT NULL DEFAULT 25,"
    " color INTEGER NOT NULL DEFAULT 16777215,"
    " send_time_ms INTEGER NOT NULL,"
    " is_visible INTEGER NOT NULL DEFAULT 1,"
    " status INTEGER NOT NULL DEFAULT 0);";

static constexpr const char* CREATE_SENT_DANMAKU_INDEX =
    "CREATE INDEX IF NOT EXISTS idx_sent_danmaku_cid_status ON sent_danmaku (cid, status);";

static constexpr const char* CREATE_LIVE_IDS =
    "CREATE TEMP TABLE IF NOT EXISTS live_dmid (dmid TEXT PRIMARY KEY);";

static constexpr const char* INSERT_LIVE_ID =
    "INSERT OR IGNORE INTO temp.live_dmid(dmid) VALUES(?);";

static constexpr const char* INSERT_ACCEPTED =
    "INSERT OR IGNORE INTO sent_danmaku"
    "(dmid,cid,bvid,content,progress,mode,font_size,color,send_time_ms,is_visible,status)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,0);";

static constexpr const char* VERIFY_LIVE =
    "UPDATE sent_danmaku SET status=1"
    " WHERE status=0 AND dmid IN (SELECT dmid FROM temp.live_dmid);";

static constexpr const char* MARK_LOST_EXCEPT_LIVE =
    "UPDATE sent_danmaku SET status=2"
    " WHERE cid=? AND status=0 AND dmid NOT IN (SELECT dmid FROM temp.live_dmid);";

static constexpr const char* MARK_ALL_PENDING_LOST =
    "UPDATE sent_danmaku SET status=2 WHERE cid=? AND status=0;";

static constexpr const char* COUNT_MATCHING =
    "SELECT COUNT(*) FROM sent_danmaku"
    " WHERE cid=? AND bvid=? AND content=? AND progress=? AND mode=? AND font_size=? AND color=?"
    " AND status IN (0,1);";

static constexpr const char* SELECT_STATS =
    "SELECT COUNT(*),"
    " COALESCE(SUM(CASE WHEN status=1 THEN 1 ELSE 0 END),0),"
    " COALESCE(SUM(CASE WHEN status=2 THEN 1 ELSE 0 END),0)"
    " FROM sent_danmaku WHERE cid=?;";

#define DANMAKU_RECORD_COLUMNS \
  "dmid,cid,bvid,content,progress,mode,font_size,color,send_time_ms,is_visible,status"

static constexpr const char* SELECT_BY_ID =
    "SELECT " DANMAKU_RECORD_COLUMNS " FROM sent_danmaku WHERE dmid=?;";

static constexpr const char* SELECT_PENDING =
    "SELECT " DANMAKU_RECORD_COLUMNS " FROM sent_danmaku WHERE cid=? AND status=0 ORDER BY send_time_ms;";

// ?1 keyword ('' = any), ?2 status (-1 = any), ?3 limit
static constexpr const char* SELECT_HISTORY =
    "SELECT " DANMAKU_RECORD_COLUMNS " FROM sent_danmaku"
    " WHERE (?1 = '' OR instr(content, ?1) > 0)"
    " AND (?2 < 0 OR status = ?2)"
    " ORDER BY send_time_ms DESC, rowid DESC LIMIT ?3;";

#undef DANMAKU_RECORD_COLUMNS

}
