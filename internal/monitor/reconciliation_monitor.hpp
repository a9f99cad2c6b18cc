#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/client/api_client.hpp"
#include "internal/db/api/lifecycle_store.hpp"
#include "internal/model/danmaku.hpp"
#include "internal/util/cancellation.hpp"

namespace danmaku::monitor {

struct MonitorStats {
  uint64_t total    = 0;
  uint64_t verified = 0;
  uint64_t pending  = 0;
  uint64_t lost     = 0;
};

struct MonitorOptions {
  std::chrono::seconds refresh_interval{60};
};

struct SweepResult {
  bool        fetched  = false;
  std::size_t live     = 0;
  std::size_t verified = 0;
  std::size_t lost     = 0;
};

using StatsCallback = std::function<void(const MonitorStats&)>;

/*
  Reconciles lifecycle rows against the provider's public listing.

  Run() only promotes PENDING -> VERIFIED. Declaring rows LOST is an
  explicit Sweep(), and only after a successful fetch.
*/
class ReconciliationMonitor {
 public:
  ReconciliationMonitor(std::shared_ptr<client::ApiClient> client, std::shared_ptr<db::LifecycleStore> store);

  // Blocks until cancelled. Fetch failures are logged and retried next tick.
  void Run(const danmaku::model::VideoTarget& target, const MonitorOptions& options, const util::CancellationToken& cancel,
           const StatsCallback& on_stats = {});

  // One fetch + verify + stats round.
  MonitorStats Tick(const danmaku::model::VideoTarget& target);

  SweepResult Sweep(const danmaku::model::VideoTarget& target);

  MonitorStats ReadStats(int64_t cid);

 private:
  // nullopt when the listing could not be fetched or decoded.
  std::optional<std::vector<std::string>> FetchLiveIds(int64_t cid);

  std::shared_ptr<client::ApiClient>  client_;
  std::shared_ptr<db::LifecycleStore> store_;
};

} // namespace danmaku::monitor
