#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/lifecycle_record.hpp"
#include "internal/model/danmaku.hpp"

namespace danmaku::db {

/*
  Durable record of every accepted submission.

  GUARANTEES (all backends):

  - RecordAccepted is idempotent on dmid
  - Status transitions are monotonic: PENDING -> {VERIFIED, LOST}
  - Every call is its own transaction; safe from several threads
  - Nothing here throws after construction; failures are logged and
    reported as zero / empty
*/
class LifecycleStore {
 public:
  virtual ~LifecycleStore() = default;

  virtual void RecordAccepted(const danmaku::model::VideoTarget& target, const danmaku::model::Danmaku& dm,
                              bool is_visible) = 0;

  // Returns rows moved PENDING -> VERIFIED.
  virtual std::size_t Verify(const std::vector<std::string>& dmids) = 0;

  // PENDING rows of cid not in live_dmids become LOST. Returns rows moved.
  virtual std::size_t MarkLost(int64_t cid, const std::vector<std::string>& live_dmids) = 0;

  // Rows with the same target and fingerprint that are PENDING or VERIFIED.
  virtual std::size_t CountMatching(const danmaku::model::VideoTarget& target, const danmaku::model::Danmaku& dm) = 0;

  virtual model::LifecycleStats GetStats(int64_t cid) = 0;

  virtual std::vector<model::LifecycleRecord> QueryHistory(const model::HistoryQuery& query) = 0;

  virtual std::vector<model::LifecycleRecord> GetPendingRecords(int64_t cid) = 0;

  virtual std::optional<model::LifecycleRecord> Get(const std::string& dmid) = 0;
};

} // namespace danmaku::db
