#include "reconciliation_monitor.hpp"

#include <exception>

#include "internal/listing/listing_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace danmaku::monitor {

using danmaku::observability::IntField;
using danmaku::observability::StringField;

ReconciliationMonitor::ReconciliationMonitor(std::shared_ptr<client::ApiClient>  client,
                                             std::shared_ptr<db::LifecycleStore> store)
    : client_(std::move(client)), store_(std::move(store)) {
  if (!client_ || !store_) {
    throw util::InvalidArgument("ReconciliationMonitor requires an api client and a lifecycle store");
  }
}

std::optional<std::vector<std::string>> ReconciliationMonitor::FetchLiveIds(int64_t cid) {
  std::string xml;
  try {
    xml = client_->FetchLiveListing(cid);
  } catch (const util::ApiError& e) {
    DANMAKU_LOG_WARN("live listing fetch failed", {IntField("cid", cid), IntField("code", e.Code()), StringField("error", e.Message())});
    return std::nullopt;
  } catch (const std::exception& e) {
    DANMAKU_LOG_ERROR("live listing fetch failed", {IntField("cid", cid), StringField("error", e.what())});
    return std::nullopt;
  }

  // a page that is not a complete <i> listing must not be read as "nothing survived"
  const auto records = listing::TryParseListing(xml, true);
  if (!records) {
    DANMAKU_LOG_WARN("live listing is not a listing document", {IntField("cid", cid), IntField("bytes", static_cast<int64_t>(xml.size()))});
    return std::nullopt;
  }

  std::vector<std::string> ids;
  for (const auto& dm : *records) {
    if (!dm.dmid.empty()) ids.push_back(dm.dmid);
  }
  return ids;
}

MonitorStats ReconciliationMonitor::ReadStats(int64_t cid) {
  const auto   s = store_->GetStats(cid);
  MonitorStats out;
  out.total    = s.total;
  out.verified = s.verified;
  out.lost     = s.lost;
  out.pending  = s.Pending();
  return out;
}

MonitorStats ReconciliationMonitor::Tick(const danmaku::model::VideoTarget& target) {
  if (auto ids = FetchLiveIds(target.cid); ids && !ids->empty()) {
    const auto verified = store_->Verify(*ids);
    if (verified > 0) {
      DANMAKU_LOG_INFO("confirmed surviving danmaku", {IntField("cid", target.cid), IntField("verified", static_cast<int64_t>(verified))});
    }
  }
  return ReadStats(target.cid);
}

void ReconciliationMonitor::Run(const danmaku::model::VideoTarget& target, const MonitorOptions& options,
                                const util::CancellationToken& cancel, const StatsCallback& on_stats) {
  DANMAKU_LOG_INFO("monitor started", {StringField("target", target.DisplayString()), IntField("cid", target.cid),
                                       IntField("interval_sec", options.refresh_interval.count())});

  while (!cancel.IsCancelled()) {
    const auto stats = Tick(target);

    if (on_stats) {
      try {
        on_stats(stats);
      } catch (const std::exception& e) {
        DANMAKU_LOG_ERROR("stats callback failed", {StringField("error", e.what())});
      }
    }

    if (cancel.WaitFor(std::chrono::duration_cast<std::chrono::milliseconds>(options.refresh_interval))) {
      DANMAKU_LOG_INFO("monitor stop requested");
      break;
    }
  }

  DANMAKU_LOG_INFO("monitor exited", {IntField("cid", target.cid)});
}

SweepResult ReconciliationMonitor::Sweep(const danmaku::model::VideoTarget& target) {
  SweepResult result;

  auto ids = FetchLiveIds(target.cid);
  if (!ids) {
    DANMAKU_LOG_WARN("sweep aborted, nothing marked lost", {IntField("cid", target.cid)});
    return result;
  }

  result.fetched  = true;
  result.live     = ids->size();
  result.verified = ids->empty() ? 0 : store_->Verify(*ids);
  result.lost     = store_->MarkLost(target.cid, *ids);

  DANMAKU_LOG_INFO("sweep finished", {IntField("cid", target.cid), IntField("live", static_cast<int64_t>(result.live)),
                                      IntField("verified", static_cast<int64_t>(result.verified)),
                                      IntField("lost", static_cast<int64_t>(result.lost))});
  return result;
}

} // namespace danmaku::monitor
