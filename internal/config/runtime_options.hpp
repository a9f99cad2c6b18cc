#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/client/curl_api_client.hpp"
#include "internal/monitor/reconciliation_monitor.hpp"
#include "internal/sender/submission_orchestrator.hpp"
#include "internal/validation/item_validator.hpp"

namespace danmaku::config {

inline constexpr const char* kDefaultStorePath        = "history.db";
inline constexpr double      kDefaultMinDelaySec      = 8.0;
inline constexpr double      kDefaultMaxDelaySec      = 8.5;
inline constexpr uint32_t    kDefaultBurstSize        = 3;
inline constexpr double      kDefaultRestMinSec       = 40.0;
inline constexpr double      kDefaultRestMaxSec       = 45.0;
inline constexpr double      kDefaultCooldownSec      = 10.0;
inline constexpr uint32_t    kDefaultRefreshSec       = 60;
inline constexpr uint32_t    kDefaultRequestTimeoutMs = 10000;

/*
  Resolve config sections into component options, filling defaults for
  unset fields. Credentials from DANMAKU_SESSDATA / DANMAKU_BILI_JCT win
  over the file.
*/
sender::SendOptions          ToSendOptions(const danmaku::runtime::config::SenderConfig& cfg);
monitor::MonitorOptions      ToMonitorOptions(const danmaku::runtime::config::MonitorConfig& cfg);
validation::ValidatorOptions ToValidatorOptions(const danmaku::runtime::config::ValidatorConfig& cfg);
client::ClientOptions        ToClientOptions(const danmaku::runtime::config::RuntimeConfig& cfg);

std::string StorePath(const danmaku::runtime::config::RuntimeConfig& cfg);

} // namespace danmaku::config
