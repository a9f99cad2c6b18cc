#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/client/api_client.hpp"
#include "internal/db/api/lifecycle_store.hpp"
#include "internal/model/danmaku.hpp"
#include "internal/model/send_result.hpp"
#include "internal/model/unsent_item.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/pacing/pacing_controller.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/time.hpp"
#include "run_context.hpp"

namespace danmaku::sender {

inline constexpr const char* kReasonManualStop = "manually stopped";
inline constexpr const char* kReasonAfterFatal = "stopped after fatal error";
inline constexpr const char* kReasonAutoStop   = "auto-stop condition reached";
inline constexpr const char* kFatalPrefix      = "fatal error: ";

struct SendOptions {
  pacing::PacingPolicy pacing;

  // 0 disables
  uint32_t stop_after_count    = 0;
  uint32_t stop_after_time_min = 0;

  bool   skip_already_sent       = true;
  double rate_limit_cooldown_sec = 10.0;
};

enum class StopReason {
  kCompleted,
  kCancelled,
  kFatal,
  kAutoStopped,
};

std::string_view ToString(StopReason reason);

struct SendSummary {
  std::size_t total     = 0;
  std::size_t attempted = 0;
  std::size_t succeeded = 0;
  std::size_t failed    = 0;
  std::size_t skipped   = 0;

  StopReason  stop_reason = StopReason::kCompleted;
  std::string auto_stop_reason;

  std::vector<danmaku::model::UnsentItem> unsent;

  // reason -> count, most frequent first
  std::vector<std::pair<std::string, std::size_t>> failure_reasons;
};

using ProgressCallback = std::function<void(std::size_t processed, std::size_t total)>;
using ResultCallback   = std::function<void(const danmaku::model::Danmaku&, const danmaku::model::SendResult&)>;

/*
  Sends one batch of items to one target, strictly one at a time.

  Every item ends up either delivered (dmid assigned, lifecycle row
  written), skipped as already delivered by an earlier run, or in the
  unsent list with a reason. Run() never throws.
*/
class SubmissionOrchestrator {
 public:
  SubmissionOrchestrator(std::shared_ptr<client::ApiClient> client, std::shared_ptr<db::LifecycleStore> store,
                         std::shared_ptr<notify::Notifier> notifier = nullptr,
                         util::SteadyNowFn                 now      = util::DefaultSteadyNow());

  SendSummary Run(const danmaku::model::VideoTarget& target, std::vector<danmaku::model::Danmaku>& items,
                  const SendOptions& options, util::CancellationToken& cancel, const ProgressCallback& on_progress = {},
                  const ResultCallback& on_result = {});

  // Fixes the pacing RNG seed for subsequent runs.
  void SetPacingSeed(uint64_t seed) {
    pacing_seed_ = seed;
    has_seed_    = true;
  }

 private:
  enum class ItemOutcome { kContinue, kStop };

  bool ShouldSkip(RunContext& ctx, const danmaku::model::VideoTarget& target, const danmaku::model::Danmaku& dm);

  ItemOutcome SendOne(RunContext& ctx, const danmaku::model::VideoTarget& target,
                      std::vector<danmaku::model::Danmaku>& items, std::size_t index, const SendOptions& options,
                      util::CancellationToken& cancel, const ResultCallback& on_result);

  bool CheckAutoStop(RunContext& ctx, const SendOptions& options) const;

  SendSummary Finish(RunContext& ctx, const danmaku::model::VideoTarget& target) const;

  void NotifyRunEnd(const SendSummary& summary) const;

  std::shared_ptr<client::ApiClient>   client_;
  std::shared_ptr<db::LifecycleStore>  store_;
  std::shared_ptr<notify::Notifier>    notifier_;
  util::SteadyNowFn                    now_;

  uint64_t pacing_seed_ = 0;
  bool     has_seed_    = false;
};

} // namespace danmaku::sender
