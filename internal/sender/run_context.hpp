#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "internal/model/danmaku.hpp"
#include "internal/model/unsent_item.hpp"
#include "internal/util/time.hpp"

namespace danmaku::sender {

/*
  Mutable state of one send run. Created by the orchestrator per call and
  passed by reference through the loop; never shared between runs.
*/
struct RunContext {
  std::size_t total     = 0;
  std::size_t attempted = 0;
  std::size_t succeeded = 0;
  std::size_t skipped   = 0;

  util::SteadyClock::time_point started_at;

  std::string auto_stop_reason;
  bool        fatal     = false;
  bool        cancelled = false;

  std::vector<danmaku::model::UnsentItem> unsent;

  // occurrences seen so far in this run / persisted count at first sight
  std::map<danmaku::model::Fingerprint, std::size_t> occurrences;
  std::map<danmaku::model::Fingerprint, std::size_t> persisted;

  std::size_t Processed() const {
    return attempted + skipped;
  }

  void MarkUnsent(const danmaku::model::Danmaku& dm, const std::string& reason) {
    unsent.push_back({dm, reason});
  }

  void MarkRemainingUnsent(const std::vector<danmaku::model::Danmaku>& items, std::size_t from, const std::string& reason) {
    for (std::size_t i = from; i < items.size(); ++i) {
      unsent.push_back({items[i], reason});
    }
  }
};

} // namespace danmaku::sender
