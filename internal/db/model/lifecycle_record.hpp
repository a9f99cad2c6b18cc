#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/lifecycle_status.hpp"

namespace danmaku::db::model {

/*
  Persistent row for one accepted danmaku.

  dmid is the primary key. status only moves PENDING -> VERIFIED or
  PENDING -> LOST; rows are never deleted.
*/
struct LifecycleRecord {
  std::string dmid;

  int64_t     cid = 0;
  std::string bvid;

  // fingerprint
  std::string content;
  int64_t     progress_ms = 0;
  int         mode        = 1;
  int         font_size   = 25;
  uint32_t    color       = 0xFFFFFF;

  uint64_t send_time_ms = 0;
  bool     is_visible   = true;

  danmaku::model::LifecycleStatus status = danmaku::model::LifecycleStatus::kPending;
};

struct LifecycleStats {
  uint64_t total    = 0;
  uint64_t verified = 0;
  uint64_t lost     = 0;

  uint64_t Pending() const {
    const uint64_t settled = verified + lost;
    return total > settled ? total - settled : 0;
  }
};

struct HistoryQuery {
  std::string                                    keyword;
  std::optional<danmaku::model::LifecycleStatus> status;
  uint32_t                                       limit = 500;
};

} // namespace danmaku::db::model
