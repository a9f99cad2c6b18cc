#include "pacing_controller.hpp"

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace danmaku::pacing {

using danmaku::observability::DoubleField;
using danmaku::observability::IntField;

PacingController::PacingController(PacingPolicy policy) : PacingController(policy, std::random_device{}()) {
}

PacingController::PacingController(PacingPolicy policy, uint64_t seed) : policy_(Normalize(policy)), rng_(seed) {
  if (policy_.BurstEnabled()) {
    DANMAKU_LOG_INFO("burst mode enabled",
                     {IntField("burst_size", policy_.burst_size), DoubleField("rest_min_sec", policy_.rest_min),
                      DoubleField("rest_max_sec", policy_.rest_max)});
  } else {
    DANMAKU_LOG_DEBUG("burst mode disabled", {IntField("burst_size", policy_.burst_size)});
  }
}

PacingPolicy PacingController::Normalize(PacingPolicy policy) {
  if (policy.normal_min < 0.0) policy.normal_min = 0.0;
  if (policy.normal_max < 0.0) policy.normal_max = 0.0;
  if (policy.normal_min > policy.normal_max) {
    DANMAKU_LOG_WARN("delay bounds reversed, swapping",
                     {DoubleField("min", policy.normal_min), DoubleField("max", policy.normal_max)});
    std::swap(policy.normal_min, policy.normal_max);
  }

  if (policy.BurstEnabled() && policy.rest_min > policy.rest_max) {
    DANMAKU_LOG_WARN("rest bounds reversed, swapping",
                     {DoubleField("min", policy.rest_min), DoubleField("max", policy.rest_max)});
    std::swap(policy.rest_min, policy.rest_max);
  }
  return policy;
}

double PacingController::Uniform(double lo, double hi) {
  if (hi <= lo) {
    return lo;
  }
  std::uniform_real_distribution<double> dist(lo, hi);
  return std::clamp(dist(rng_), lo, hi);
}

PacingDelay PacingController::NextDelay() {
  ++count_;

  PacingDelay delay;
  delay.long_rest = policy_.BurstEnabled() && (count_ % policy_.burst_size == 0);

  const double seconds = delay.long_rest ? Uniform(policy_.rest_min, policy_.rest_max)
                                         : Uniform(policy_.normal_min, policy_.normal_max);
  delay.duration = util::SecondsToMillis(seconds);
  return delay;
}

bool PacingController::WaitAndCheckCancelled(const util::CancellationToken& token) {
  if (token.IsCancelled()) {
    return true;
  }

  const auto delay = NextDelay();
  if (delay.long_rest) {
    DANMAKU_LOG_INFO("burst complete, long rest",
                     {IntField("burst_size", policy_.burst_size), IntField("delay_ms", delay.duration.count())});
  } else {
    DANMAKU_LOG_INFO("waiting", {IntField("delay_ms", delay.duration.count())});
  }

  if (token.WaitFor(delay.duration)) {
    DANMAKU_LOG_INFO("stop requested during wait");
    return true;
  }
  return false;
}

} // namespace danmaku::pacing
