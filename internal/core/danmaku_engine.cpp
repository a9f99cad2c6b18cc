#include "danmaku_engine.hpp"

#include "internal/util/errors.hpp"

namespace danmaku::core {

DanmakuEngine::DanmakuEngine(std::shared_ptr<client::ApiClient> client, std::shared_ptr<db::LifecycleStore> store,
                             std::shared_ptr<notify::Notifier> notifier, validation::ValidatorOptions validator_options)
    : store_(store),
      video_service_(client),
      orchestrator_(client, store, std::move(notifier)),
      monitor_(client, store),
      validator_options_(std::move(validator_options)) {
}

danmaku::model::VideoInfo DanmakuEngine::FetchTargetInfo(const std::string& bvid) {
  if (bvid.empty()) {
    throw util::InvalidArgument("bvid must not be empty");
  }
  return video_service_.FetchInfo(bvid);
}

ResolvedTarget DanmakuEngine::ResolveTarget(const std::string& bvid, int64_t cid) {
  const auto info = FetchTargetInfo(bvid);
  const auto part = info.FindPart(cid);
  if (!part) {
    throw util::NotFound("cid " + std::to_string(cid) + " is not a part of " + bvid);
  }

  ResolvedTarget resolved;
  resolved.target = {bvid, cid, info.parts.size() > 1 ? info.title + " P" + std::to_string(part->page) : info.title};
  resolved.part   = *part;
  return resolved;
}

std::vector<validation::ValidationIssue> DanmakuEngine::Validate(std::vector<danmaku::model::Danmaku>& items,
                                                                 int64_t duration_ms) const {
  return validation::ValidateItems(items, duration_ms, validator_options_);
}

sender::SendSummary DanmakuEngine::RunSendBatch(const danmaku::model::VideoTarget& target,
                                                std::vector<danmaku::model::Danmaku>& items, const sender::SendOptions& options,
                                                util::CancellationToken& cancel, const sender::ProgressCallback& on_progress,
                                                const sender::ResultCallback& on_result) {
  return orchestrator_.Run(target, items, options, cancel, on_progress, on_result);
}

void DanmakuEngine::RunMonitor(const danmaku::model::VideoTarget& target, const monitor::MonitorOptions& options,
                               const util::CancellationToken& cancel, const monitor::StatsCallback& on_stats) {
  monitor_.Run(target, options, cancel, on_stats);
}

monitor::SweepResult DanmakuEngine::Sweep(const danmaku::model::VideoTarget& target) {
  return monitor_.Sweep(target);
}

std::vector<db::model::LifecycleRecord> DanmakuEngine::QueryHistory(const db::model::HistoryQuery& query) {
  return store_->QueryHistory(query);
}

monitor::MonitorStats DanmakuEngine::GetStats(int64_t cid) {
  return monitor_.ReadStats(cid);
}

} // namespace danmaku::core
