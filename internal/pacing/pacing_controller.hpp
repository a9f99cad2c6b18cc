#pragma once

#include <chrono>
#include <cstdint>
#include <random>

#include "internal/util/cancellation.hpp"

namespace danmaku::pacing {

/*
  Delay bounds in seconds. Burst mode is active when burst_size > 1:
  every burst_size-th wait draws from [rest_min, rest_max] instead.
*/
struct PacingPolicy {
  double   normal_min = 8.0;
  double   normal_max = 8.5;
  uint32_t burst_size = 0;
  double   rest_min   = 0.0;
  double   rest_max   = 0.0;

  bool BurstEnabled() const {
    return burst_size > 1;
  }
};

struct PacingDelay {
  std::chrono::milliseconds duration{0};
  bool                      long_rest = false;
};

/*
  Randomised inter-submission delay with periodic long rests.

  Not thread safe; one instance per send run.
*/
class PacingController {
 public:
  explicit PacingController(PacingPolicy policy);
  PacingController(PacingPolicy policy, uint64_t seed);

  // Advances the counter and draws the next delay without waiting.
  PacingDelay NextDelay();

  // Waits the next delay. Returns true if the token is cancelled before or during the wait.
  bool WaitAndCheckCancelled(const util::CancellationToken& token);

  uint64_t Count() const {
    return count_;
  }

  const PacingPolicy& Policy() const {
    return policy_;
  }

 private:
  static PacingPolicy Normalize(PacingPolicy policy);

  double Uniform(double lo, double hi);

  PacingPolicy    policy_;
  uint64_t        count_ = 0;
  std::mt19937_64 rng_;
};

} // namespace danmaku::pacing
