#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/client/api_client.hpp"
#include "internal/db/api/lifecycle_store.hpp"
#include "internal/model/video.hpp"
#include "internal/monitor/reconciliation_monitor.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/sender/submission_orchestrator.hpp"
#include "internal/service/video_service.hpp"
#include "internal/validation/item_validator.hpp"

namespace danmaku::core {

/*
  Entry points of the send / verify / reconcile engine.

  Send and monitor calls block the calling thread until they finish or the
  token is cancelled; run them on separate threads to do both at once.
*/
struct ResolvedTarget {
  danmaku::model::VideoTarget target;
  danmaku::model::VideoPart   part;
};

class DanmakuEngine {
 public:
  DanmakuEngine(std::shared_ptr<client::ApiClient> client, std::shared_ptr<db::LifecycleStore> store,
                std::shared_ptr<notify::Notifier> notifier, validation::ValidatorOptions validator_options = {});

  danmaku::model::VideoInfo FetchTargetInfo(const std::string& bvid);

  // Throws util::NotFound when cid is not one of the video's parts.
  ResolvedTarget ResolveTarget(const std::string& bvid, int64_t cid);

  std::vector<validation::ValidationIssue> Validate(std::vector<danmaku::model::Danmaku>& items, int64_t duration_ms) const;

  sender::SendSummary RunSendBatch(const danmaku::model::VideoTarget& target, std::vector<danmaku::model::Danmaku>& items,
                                   const sender::SendOptions& options, util::CancellationToken& cancel,
                                   const sender::ProgressCallback& on_progress = {},
                                   const sender::ResultCallback&   on_result   = {});

  void RunMonitor(const danmaku::model::VideoTarget& target, const monitor::MonitorOptions& options,
                  const util::CancellationToken& cancel, const monitor::StatsCallback& on_stats = {});

  monitor::SweepResult Sweep(const danmaku::model::VideoTarget& target);

  std::vector<db::model::LifecycleRecord> QueryHistory(const db::model::HistoryQuery& query);

  monitor::MonitorStats GetStats(int64_t cid);

 private:
  std::shared_ptr<db::LifecycleStore> store_;

  service::VideoService           video_service_;
  sender::SubmissionOrchestrator  orchestrator_;
  monitor::ReconciliationMonitor  monitor_;
  validation::ValidatorOptions    validator_options_;
};

} // namespace danmaku::core
