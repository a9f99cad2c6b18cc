#include "runtime_options.hpp"

#include <cstdlib>

namespace danmaku::config {

namespace {

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value && *value ? std::string(value) : fallback;
}

} // namespace

sender::SendOptions ToSendOptions(const danmaku::runtime::config::SenderConfig& cfg) {
  sender::SendOptions opts;
  opts.pacing.normal_min = cfg.has_min_delay_sec() ? cfg.min_delay_sec() : kDefaultMinDelaySec;
  opts.pacing.normal_max = cfg.has_max_delay_sec() ? cfg.max_delay_sec() : kDefaultMaxDelaySec;
  opts.pacing.burst_size = cfg.has_burst_size() ? cfg.burst_size() : kDefaultBurstSize;
  opts.pacing.rest_min   = cfg.has_rest_min_sec() ? cfg.rest_min_sec() : kDefaultRestMinSec;
  opts.pacing.rest_max   = cfg.has_rest_max_sec() ? cfg.rest_max_sec() : kDefaultRestMaxSec;

  opts.stop_after_count        = cfg.stop_after_count();
  opts.stop_after_time_min     = cfg.stop_after_time_min();
  opts.skip_already_sent       = cfg.has_skip_already_sent() ? cfg.skip_already_sent() : true;
  opts.rate_limit_cooldown_sec = cfg.has_rate_limit_cooldown_sec() ? cfg.rate_limit_cooldown_sec() : kDefaultCooldownSec;
  return opts;
}

monitor::MonitorOptions ToMonitorOptions(const danmaku::runtime::config::MonitorConfig& cfg) {
  monitor::MonitorOptions opts;
  opts.refresh_interval = std::chrono::seconds(cfg.refresh_interval_sec() > 0 ? cfg.refresh_interval_sec() : kDefaultRefreshSec);
  return opts;
}

validation::ValidatorOptions ToValidatorOptions(const danmaku::runtime::config::ValidatorConfig& cfg) {
  validation::ValidatorOptions opts;
  opts.enabled = cfg.enabled();
  opts.blocked_keywords.assign(cfg.blocked_keywords().begin(), cfg.blocked_keywords().end());
  return opts;
}

client::ClientOptions ToClientOptions(const danmaku::runtime::config::RuntimeConfig& cfg) {
  client::ClientOptions opts;
  opts.sessdata         = EnvOr("DANMAKU_SESSDATA", cfg.auth().sessdata());
  opts.bili_jct         = EnvOr("DANMAKU_BILI_JCT", cfg.auth().bili_jct());
  opts.use_system_proxy = cfg.network().has_use_system_proxy() ? cfg.network().use_system_proxy() : true;
  opts.timeout          = std::chrono::milliseconds(
      cfg.network().request_timeout_ms() > 0 ? cfg.network().request_timeout_ms() : kDefaultRequestTimeoutMs);
  if (!cfg.network().user_agent().empty()) {
    opts.user_agent = cfg.network().user_agent();
  }
  return opts;
}

std::string StorePath(const danmaku::runtime::config::RuntimeConfig& cfg) {
  return cfg.store().path().empty() ? kDefaultStorePath : cfg.store().path();
}

} // namespace danmaku::config
