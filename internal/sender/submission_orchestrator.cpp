#include "submission_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

#include "internal/errors/error_classifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace danmaku::sender {

using danmaku::model::Danmaku;
using danmaku::model::Fingerprint;
using danmaku::model::VideoTarget;
using danmaku::observability::BoolField;
using danmaku::observability::IntField;
using danmaku::observability::StringField;

namespace {

int64_t AsInt(std::size_t v) {
  return static_cast<int64_t>(v);
}

void ReportProgress(const ProgressCallback& on_progress, std::size_t processed, std::size_t total) {
  if (!on_progress) return;
  try {
    on_progress(processed, total);
  } catch (const std::exception& e) {
    DANMAKU_LOG_ERROR("progress callback failed", {StringField("error", e.what())});
  }
}

void ReportResult(const ResultCallback& on_result, const Danmaku& dm, const danmaku::model::SendResult& result) {
  if (!on_result) return;
  try {
    on_result(dm, result);
  } catch (const std::exception& e) {
    DANMAKU_LOG_ERROR("result callback failed, run continues", {StringField("error", e.what())});
  }
}

std::vector<std::pair<std::string, std::size_t>> TallyReasons(const std::vector<danmaku::model::UnsentItem>& unsent) {
  std::vector<std::pair<std::string, std::size_t>> tally;
  for (const auto& item : unsent) {
    auto it = std::find_if(tally.begin(), tally.end(), [&](const auto& e) { return e.first == item.reason; });
    if (it == tally.end()) {
      tally.emplace_back(item.reason, 1);
    } else {
      ++it->second;
    }
  }
  std::stable_sort(tally.begin(), tally.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
  return tally;
}

} // namespace

std::string_view ToString(StopReason reason) {
  switch (reason) {
    case StopReason::kCompleted:
      return "completed";
    case StopReason::kCancelled:
      return "cancelled";
    case StopReason::kFatal:
      return "fatal";
    case StopReason::kAutoStopped:
      return "auto_stopped";
  }
  return "completed";
}

SubmissionOrchestrator::SubmissionOrchestrator(std::shared_ptr<client::ApiClient>  client,
                                               std::shared_ptr<db::LifecycleStore> store,
                                               std::shared_ptr<notify::Notifier> notifier, util::SteadyNowFn now)
    : client_(std::move(client)), store_(std::move(store)), notifier_(std::move(notifier)), now_(std::move(now)) {
  if (!client_ || !store_) {
    throw util::InvalidArgument("SubmissionOrchestrator requires an api client and a lifecycle store");
  }
  if (!now_) {
    now_ = util::DefaultSteadyNow();
  }
}

SendSummary SubmissionOrchestrator::Run(const VideoTarget& target, std::vector<Danmaku>& items, const SendOptions& options,
                                        util::CancellationToken& cancel, const ProgressCallback& on_progress,
                                        const ResultCallback& on_result) {
  DANMAKU_LOG_INFO("send run starting", {StringField("target", target.DisplayString()), StringField("bvid", target.bvid),
                                         IntField("cid", target.cid), IntField("items", AsInt(items.size()))});

  RunContext ctx;
  ctx.total      = items.size();
  ctx.started_at = now_();

  ReportProgress(on_progress, 0, ctx.total);
  if (items.empty()) {
    return Finish(ctx, target);
  }

  pacing::PacingController pacer =
      has_seed_ ? pacing::PacingController(options.pacing, pacing_seed_) : pacing::PacingController(options.pacing);

  for (std::size_t i = 0; i < items.size(); ++i) {
    if (cancel.IsCancelled()) {
      ctx.cancelled = true;
      ctx.MarkRemainingUnsent(items, i, kReasonManualStop);
      break;
    }

    if (options.skip_already_sent && ShouldSkip(ctx, target, items[i])) {
      ++ctx.skipped;
      ReportProgress(on_progress, ctx.Processed(), ctx.total);
      continue;
    }

    if (SendOne(ctx, target, items, i, options, cancel, on_result) == ItemOutcome::kStop) {
      ReportProgress(on_progress, ctx.Processed(), ctx.total);
      break;
    }
    ReportProgress(on_progress, ctx.Processed(), ctx.total);

    if (CheckAutoStop(ctx, options)) {
      ctx.MarkRemainingUnsent(items, i + 1, kReasonAutoStop);
      cancel.Cancel();
      break;
    }

    if (i + 1 < items.size() && pacer.WaitAndCheckCancelled(cancel)) {
      ctx.cancelled = true;
      ctx.MarkRemainingUnsent(items, i + 1, kReasonManualStop);
      break;
    }
  }

  return Finish(ctx, target);
}

bool SubmissionOrchestrator::ShouldSkip(RunContext& ctx, const VideoTarget& target, const Danmaku& dm) {
  const auto fp         = Fingerprint::Of(dm);
  const auto occurrence = ++ctx.occurrences[fp];

  auto it = ctx.persisted.find(fp);
  if (it == ctx.persisted.end()) {
    it = ctx.persisted.emplace(fp, store_->CountMatching(target, dm)).first;
  }

  if (occurrence <= it->second) {
    DANMAKU_LOG_INFO("skipping already sent item", {StringField("msg", dm.msg), IntField("progress_ms", dm.progress_ms),
                                                    IntField("occurrence", AsInt(occurrence)),
                                                    IntField("persisted", AsInt(it->second))});
    return true;
  }
  return false;
}

SubmissionOrchestrator::ItemOutcome SubmissionOrchestrator::SendOne(RunContext& ctx, const VideoTarget& target,
                                                                    std::vector<Danmaku>& items, std::size_t index,
                                                                    const SendOptions& options,
                                                                    util::CancellationToken& cancel,
                                                                    const ResultCallback& on_result) {
  auto& dm = items[index];
  ++ctx.attempted;
  DANMAKU_LOG_INFO("sending", {IntField("index", AsInt(index + 1)), IntField("total", AsInt(ctx.total)),
                               StringField("msg", dm.msg)});

  model::SendResult       result;
  errors::Classification c;
  try {
    const auto response = client_->SubmitDanmaku(target, dm);
    result              = errors::ResultFromResponse(response);
    c                   = errors::Classify(response.code(), response.message());
  } catch (const std::exception& e) {
    c      = errors::ClassifyException(e);
    result = errors::ResultFromClassification(c, e.what());
    DANMAKU_LOG_ERROR("send raised", {StringField("msg", dm.msg), StringField("error", e.what()),
                                      StringField("outcome", errors::ToString(c.outcome))});
  } catch (...) {
    // not derived from std::exception; halts the run as an unknown error
    c      = errors::Classify(errors::UnknownError().code);
    result = errors::ResultFromClassification(c, "non-standard exception from api client");
    DANMAKU_LOG_ERROR("send raised non-standard exception",
                      {StringField("msg", dm.msg), StringField("outcome", errors::ToString(c.outcome))});
  }

  if (c.IsSuccess()) {
    ++ctx.succeeded;
    if (!result.dmid.empty()) {
      dm.dmid = result.dmid;
    }
    DANMAKU_LOG_INFO("sent", {StringField("dmid", result.dmid), StringField("msg", dm.msg),
                              BoolField("visible", result.is_visible)});

    ReportResult(on_result, dm, result);

    if (dm.IsSent()) {
      store_->RecordAccepted(target, dm, result.is_visible);
    } else {
      DANMAKU_LOG_WARN("provider accepted item without dmid, not recorded", {StringField("msg", dm.msg)});
    }
    return ItemOutcome::kContinue;
  }

  ReportResult(on_result, dm, result);

  if (c.HaltsBatch()) {
    ctx.fatal = true;
    DANMAKU_LOG_CRITICAL("fatal error, stopping run",
                         {IntField("code", result.code), StringField("reason", result.display_message),
                          StringField("outcome", errors::ToString(c.outcome))});
    ctx.MarkUnsent(dm, kFatalPrefix + result.display_message);
    ctx.MarkRemainingUnsent(items, index + 1, kReasonAfterFatal);
    return ItemOutcome::kStop;
  }

  DANMAKU_LOG_WARN("send failed", {IntField("code", result.code), StringField("reason", result.display_message),
                                   StringField("msg", dm.msg)});
  ctx.MarkUnsent(dm, result.display_message);

  if (c.needs_cooldown && options.rate_limit_cooldown_sec > 0.0) {
    const auto cooldown = util::SecondsToMillis(options.rate_limit_cooldown_sec);
    DANMAKU_LOG_WARN("rate limited, cooling down", {IntField("cooldown_ms", cooldown.count())});
    if (cancel.WaitFor(cooldown)) {
      ctx.cancelled = true;
      ctx.MarkRemainingUnsent(items, index + 1, kReasonManualStop);
      return ItemOutcome::kStop;
    }
  }
  return ItemOutcome::kContinue;
}

bool SubmissionOrchestrator::CheckAutoStop(RunContext& ctx, const SendOptions& options) const {
  if (options.stop_after_count > 0 && ctx.succeeded >= options.stop_after_count) {
    ctx.auto_stop_reason = "count limit reached (" + std::to_string(options.stop_after_count) + " items)";
  } else if (options.stop_after_time_min > 0 &&
             now_() - ctx.started_at >= std::chrono::minutes(options.stop_after_time_min)) {
    ctx.auto_stop_reason = "time limit reached (" + std::to_string(options.stop_after_time_min) + " minutes)";
  } else {
    return false;
  }

  DANMAKU_LOG_INFO("auto-stop", {StringField("reason", ctx.auto_stop_reason)});
  return true;
}

SendSummary SubmissionOrchestrator::Finish(RunContext& ctx, const VideoTarget& target) const {
  SendSummary s;
  s.total            = ctx.total;
  s.attempted        = ctx.attempted;
  s.succeeded        = ctx.succeeded;
  s.failed           = ctx.attempted - ctx.succeeded;
  s.skipped          = ctx.skipped;
  s.auto_stop_reason = ctx.auto_stop_reason;

  if (!ctx.auto_stop_reason.empty()) {
    s.stop_reason = StopReason::kAutoStopped;
  } else if (ctx.cancelled) {
    s.stop_reason = StopReason::kCancelled;
  } else if (ctx.fatal) {
    s.stop_reason = StopReason::kFatal;
  } else {
    s.stop_reason = StopReason::kCompleted;
  }

  s.unsent          = std::move(ctx.unsent);
  s.failure_reasons = TallyReasons(s.unsent);

  const auto level = s.stop_reason == StopReason::kFatal ? spdlog::level::critical : spdlog::level::info;
  danmaku::observability::Log(level, "send run finished",
                              {StringField("target", target.DisplayString()),
                               StringField("stop_reason", ToString(s.stop_reason)),
                               StringField("auto_stop_reason", s.auto_stop_reason), IntField("total", AsInt(s.total)),
                               IntField("attempted", AsInt(s.attempted)), IntField("succeeded", AsInt(s.succeeded)),
                               IntField("failed", AsInt(s.failed)), IntField("skipped", AsInt(s.skipped)),
                               IntField("unsent", AsInt(s.unsent.size()))});

  for (const auto& [reason, count] : s.failure_reasons) {
    DANMAKU_LOG_WARN("unsent reason", {StringField("reason", reason), IntField("count", AsInt(count))});
  }

  NotifyRunEnd(s);
  return s;
}

void SubmissionOrchestrator::NotifyRunEnd(const SendSummary& s) const {
  if (!notifier_) return;

  const std::string title   = "Danmaku send run finished";
  const std::string summary = "succeeded: " + std::to_string(s.succeeded) + " / attempted: " + std::to_string(s.attempted) +
                              " / total: " + std::to_string(s.total);

  std::string message;
  switch (s.stop_reason) {
    case StopReason::kAutoStopped:
      message = "Run stopped automatically: " + s.auto_stop_reason + "\n" + summary;
      break;
    case StopReason::kCancelled:
      message = "Run was stopped manually.\n" + summary;
      break;
    case StopReason::kFatal:
      message = "Run interrupted by a fatal error!\n" + summary;
      break;
    case StopReason::kCompleted:
      if (s.total == 0) {
        message = "Nothing to send.";
      } else if (s.attempted == 0) {
        message = "Nothing new to send; all " + std::to_string(s.skipped) + " items were sent before.";
      } else if (s.succeeded == s.attempted) {
        message = "Run complete!\nAll " + std::to_string(s.succeeded) + " items were sent.";
      } else {
        message = "Run complete.\n" + summary;
      }
      break;
  }

  try {
    notifier_->Notify(title, message);
  } catch (const std::exception& e) {
    DANMAKU_LOG_WARN("notification failed", {StringField("error", e.what())});
  }
}

} // namespace danmaku::sender
