#include "internal/pacing/pacing_controller.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/util/cancellation.hpp"

using danmaku::pacing::PacingController;
using danmaku::pacing::PacingPolicy;
using danmaku::util::CancellationToken;

namespace {

void TestNormalDrawsStayInBounds() {
  PacingPolicy policy;
  policy.normal_min = 1.0;
  policy.normal_max = 2.0;

  PacingController pacer(policy, 42);
  for (int i = 0; i < 1000; ++i) {
    auto d = pacer.NextDelay();
    assert(!d.long_rest);
    assert(d.duration >= std::chrono::milliseconds(1000));
    assert(d.duration <= std::chrono::milliseconds(2000));
  }
  assert(pacer.Count() == 1000);
}

void TestBurstRestsEveryNth() {
  PacingPolicy policy;
  policy.normal_min = 1.0;
  policy.normal_max = 2.0;
  policy.burst_size = 5;
  policy.rest_min   = 30.0;
  policy.rest_max   = 40.0;

  PacingController pacer(policy, 7);
  for (int i = 1; i <= 100; ++i) {
    auto d = pacer.NextDelay();
    if (i % 5 == 0) {
      assert(d.long_rest);
      assert(d.duration >= std::chrono::milliseconds(30000));
      assert(d.duration <= std::chrono::milliseconds(40000));
    } else {
      assert(!d.long_rest);
      assert(d.duration <= std::chrono::milliseconds(2000));
    }
  }
}

void TestBurstSizeOneDisablesRests() {
  PacingPolicy policy;
  policy.normal_min = 0.5;
  policy.normal_max = 0.5;
  policy.burst_size = 1;
  policy.rest_min   = 60.0;
  policy.rest_max   = 60.0;

  PacingController pacer(policy, 1);
  for (int i = 0; i < 10; ++i) {
    auto d = pacer.NextDelay();
    assert(!d.long_rest);
    assert(d.duration == std::chrono::milliseconds(500));
  }
}

void TestReversedBoundsAreSwapped() {
  PacingPolicy policy;
  policy.normal_min = 3.0;
  policy.normal_max = 1.0;

  PacingController pacer(policy, 3);
  assert(pacer.Policy().normal_min == 1.0);
  assert(pacer.Policy().normal_max == 3.0);
  for (int i = 0; i < 100; ++i) {
    auto d = pacer.NextDelay();
    assert(d.duration >= std::chrono::milliseconds(1000));
    assert(d.duration <= std::chrono::milliseconds(3000));
  }
}

void TestAlreadyCancelledReturnsImmediately() {
  PacingPolicy policy;
  policy.normal_min = 60.0;
  policy.normal_max = 60.0;

  PacingController  pacer(policy, 5);
  CancellationToken token;
  token.Cancel();

  const auto start = std::chrono::steady_clock::now();
  assert(pacer.WaitAndCheckCancelled(token));
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
  assert(pacer.Count() == 0);
}

void TestCancellationDuringWait() {
  PacingPolicy policy;
  policy.normal_min = 30.0;
  policy.normal_max = 30.0;

  PacingController  pacer(policy, 5);
  CancellationToken token;

  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token.Cancel();
  });

  const auto start     = std::chrono::steady_clock::now();
  const bool cancelled = pacer.WaitAndCheckCancelled(token);
  const auto elapsed   = std::chrono::steady_clock::now() - start;
  canceller.join();

  assert(cancelled);
  assert(elapsed < std::chrono::seconds(10));
}

void TestZeroDelayDoesNotWait() {
  PacingPolicy policy;
  policy.normal_min = 0.0;
  policy.normal_max = 0.0;

  PacingController  pacer(policy, 9);
  CancellationToken token;
  assert(!pacer.WaitAndCheckCancelled(token));
  assert(pacer.Count() == 1);
}

} // namespace

int main() {
  TestNormalDrawsStayInBounds();
  TestBurstRestsEveryNth();
  TestBurstSizeOneDisablesRests();
  TestReversedBoundsAreSwapped();
  TestAlreadyCancelledReturnsImmediately();
  TestCancellationDuringWait();
  TestZeroDelayDoesNotWait();

  std::cout << "danmaku_sender_unit_pacing_controller: pass\n";
  return 0;
}
