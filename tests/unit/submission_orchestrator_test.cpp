#include "internal/sender/submission_orchestrator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/sqlite/sqlite_lifecycle_store.hpp"
#include "internal/errors/error_classifier.hpp"
#include "internal/model/lifecycle_status.hpp"
#include "tests/support/fake_api_client.hpp"

using danmaku::db::sqlite::SqliteLifecycleStore;
using danmaku::model::Danmaku;
using danmaku::model::VideoTarget;
using danmaku::sender::SendOptions;
using danmaku::sender::StopReason;
using danmaku::sender::SubmissionOrchestrator;
using danmaku::testing::FakeApiClient;
using danmaku::testing::TempStorePath;
using danmaku::util::CancellationToken;

namespace {

const VideoTarget kTarget{"BV1orchestr", 777, "orchestrator"};

class RecordingNotifier final : public danmaku::notify::Notifier {
 public:
  void Notify(const std::string& title, const std::string& message) override {
    ++calls;
    last_title   = title;
    last_message = message;
  }

  int         calls = 0;
  std::string last_title;
  std::string last_message;
};

SendOptions FastOptions() {
  SendOptions opts;
  opts.pacing.normal_min       = 0.0;
  opts.pacing.normal_max       = 0.0;
  opts.pacing.burst_size       = 0;
  opts.rate_limit_cooldown_sec = 0.0;
  opts.skip_already_sent       = true;
  return opts;
}

std::vector<Danmaku> Items(int n, const std::string& prefix = "item") {
  std::vector<Danmaku> out;
  for (int i = 0; i < n; ++i) {
    Danmaku dm;
    dm.msg         = prefix + std::to_string(i + 1);
    dm.progress_ms = 1000 * (i + 1);
    out.push_back(dm);
  }
  return out;
}

struct Fixture {
  explicit Fixture(const std::string& name)
      : client(std::make_shared<FakeApiClient>()),
        store(std::make_shared<SqliteLifecycleStore>(TempStorePath(name))),
        notifier(std::make_shared<RecordingNotifier>()),
        orchestrator(client, store, notifier) {
    orchestrator.SetPacingSeed(1);
  }

  std::shared_ptr<FakeApiClient>        client;
  std::shared_ptr<SqliteLifecycleStore> store;
  std::shared_ptr<RecordingNotifier>    notifier;
  SubmissionOrchestrator                orchestrator;
};

void TestAllSucceed() {
  Fixture           f("all_succeed");
  auto              items = Items(3);
  CancellationToken cancel;

  std::vector<std::pair<std::size_t, std::size_t>> progress;
  int                                              results = 0;

  auto s = f.orchestrator.Run(
      kTarget, items, FastOptions(), cancel,
      [&](std::size_t done, std::size_t total) { progress.emplace_back(done, total); },
      [&](const Danmaku&, const danmaku::model::SendResult& r) {
        assert(r.is_success);
        ++results;
      });

  assert(s.stop_reason == StopReason::kCompleted);
  assert(s.total == 3 && s.attempted == 3 && s.succeeded == 3 && s.failed == 0);
  assert(s.unsent.empty());
  assert(results == 3);
  assert(progress.front() == std::make_pair(std::size_t{0}, std::size_t{3}));
  assert(progress.back() == std::make_pair(std::size_t{3}, std::size_t{3}));

  for (const auto& dm : items) {
    assert(dm.IsSent());
    auto rec = f.store->Get(dm.dmid);
    assert(rec.has_value());
    assert(rec->status == danmaku::model::LifecycleStatus::kPending);
    assert(rec->content == dm.msg);
  }
  assert(f.notifier->calls == 1);
  assert(!cancel.IsCancelled());
}

void TestEmptyBatch() {
  Fixture              f("empty_batch");
  std::vector<Danmaku> items;
  CancellationToken    cancel;

  auto s = f.orchestrator.Run(kTarget, items, FastOptions(), cancel);
  assert(s.stop_reason == StopReason::kCompleted);
  assert(s.total == 0 && s.attempted == 0);
  assert(f.client->Submitted().empty());
  assert(f.notifier->last_message == "Nothing to send.");
}

void TestSkipDuplicatesAcrossRuns() {
  Fixture f("skip_duplicates");

  Danmaku dm;
  dm.msg         = "same text";
  dm.progress_ms = 12000;

  auto a = dm;
  a.dmid = "prev-1";
  auto b = dm;
  b.dmid = "prev-2";
  f.store->RecordAccepted(kTarget, a, true);
  f.store->RecordAccepted(kTarget, b, true);

  std::vector<Danmaku> items = {dm, dm, dm};
  CancellationToken    cancel;

  auto s = f.orchestrator.Run(kTarget, items, FastOptions(), cancel);
  assert(s.skipped == 2);
  assert(s.attempted == 1);
  assert(s.succeeded == 1);
  assert(f.client->Submitted().size() == 1);
  assert(!items[0].IsSent() && !items[1].IsSent() && items[2].IsSent());
  assert(f.store->CountMatching(kTarget, dm) == 3);
}

void TestSkipDisabledSendsEverything() {
  Fixture f("skip_disabled");

  Danmaku dm;
  dm.msg         = "dup";
  dm.progress_ms = 500;
  auto prev      = dm;
  prev.dmid      = "prev";
  f.store->RecordAccepted(kTarget, prev, true);

  auto opts              = FastOptions();
  opts.skip_already_sent = false;

  std::vector<Danmaku> items = {dm, dm};
  CancellationToken    cancel;
  auto                 s = f.orchestrator.Run(kTarget, items, opts, cancel);
  assert(s.skipped == 0);
  assert(s.attempted == 2);
}

void TestFatalShortCircuits() {
  Fixture f("fatal");
  f.client->PushResponse(FakeApiClient::Ok("d1"));
  f.client->PushResponse(FakeApiClient::Ok("d2"));
  f.client->PushResponse(FakeApiClient::Fail(-101, "account not logged in"));

  auto              items = Items(10);
  CancellationToken cancel;
  auto              s = f.orchestrator.Run(kTarget, items, FastOptions(), cancel);

  assert(s.stop_reason == StopReason::kFatal);
  assert(s.attempted == 3);
  assert(s.succeeded == 2);
  assert(s.failed == 1);
  assert(f.client->Submitted().size() == 3);
  assert(s.unsent.size() == 8);
  assert(s.unsent[0].dm.msg == "item3");
  assert(s.unsent[0].reason.rfind(danmaku::sender::kFatalPrefix, 0) == 0);
  for (std::size_t i = 1; i < s.unsent.size(); ++i) {
    assert(s.unsent[i].reason == danmaku::sender::kReasonAfterFatal);
    assert(s.unsent[i].dm.msg == "item" + std::to_string(i + 3));
  }
  assert(s.failure_reasons.front().first == danmaku::sender::kReasonAfterFatal);
  assert(s.failure_reasons.front().second == 7);
}

void TestNetworkErrorIsFatal() {
  Fixture f("network_fatal");
  f.client->PushThrow(danmaku::util::TimeoutError("timed out"));

  auto              items = Items(4);
  CancellationToken cancel;
  auto              s = f.orchestrator.Run(kTarget, items, FastOptions(), cancel);

  assert(s.stop_reason == StopReason::kFatal);
  assert(s.attempted == 1);
  assert(s.unsent.size() == 4);
}

void TestNonStandardExceptionIsFatal() {
  Fixture f("non_standard_throw");
  f.client->PushThrow(42);

  auto              items = Items(3);
  CancellationToken cancel;
  auto              s = f.orchestrator.Run(kTarget, items, FastOptions(), cancel);

  assert(s.stop_reason == StopReason::kFatal);
  assert(s.attempted == 1);
  assert(s.succeeded == 0);
  assert(f.client->Submitted().size() == 1);
  assert(s.unsent.size() == 3);
  assert(s.unsent[0].dm.msg == "item1");
  assert(s.unsent[0].reason.rfind(danmaku::sender::kFatalPrefix, 0) == 0);
  assert(s.unsent[1].reason == danmaku::sender::kReasonAfterFatal);
  assert(s.unsent[2].reason == danmaku::sender::kReasonAfterFatal);
}

void TestRetryableContinues() {
  Fixture f("retryable");
  f.client->PushResponse(FakeApiClient::Fail(36701, "forbidden"));
  f.client->PushResponse(FakeApiClient::Ok("ok2"));
  f.client->PushResponse(FakeApiClient::Fail(36702, "too long"));

  auto              items = Items(4);
  CancellationToken cancel;
  auto              s = f.orchestrator.Run(kTarget, items, FastOptions(), cancel);

  assert(s.stop_reason == StopReason::kCompleted);
  assert(s.attempted == 4);
  assert(s.succeeded == 2);
  assert(s.failed == 2);
  assert(s.unsent.size() == 2);
  assert(s.unsent[0].dm.msg == "item1");
  assert(s.unsent[1].dm.msg == "item3");
}

void TestRateLimitCooldownIsCancellable() {
  Fixture f("rate_limit");
  f.client->PushResponse(FakeApiClient::Fail(danmaku::errors::kFreqLimitCode, "slow down"));

  auto opts                    = FastOptions();
  opts.rate_limit_cooldown_sec = 60.0;

  auto              items = Items(3);
  CancellationToken cancel;
  std::thread       stopper([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    cancel.Cancel();
  });

  const auto start = std::chrono::steady_clock::now();
  auto       s     = f.orchestrator.Run(kTarget, items, opts, cancel);
  stopper.join();

  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(30));
  assert(s.stop_reason == StopReason::kCancelled);
  assert(s.attempted == 1);
  assert(s.unsent.size() == 3);
  assert(s.unsent[1].reason == danmaku::sender::kReasonManualStop);
}

void TestCancelDuringPacingWait() {
  Fixture f("pacing_cancel");

  auto opts              = FastOptions();
  opts.pacing.normal_min = 30.0;
  opts.pacing.normal_max = 30.0;

  auto              items = Items(4);
  CancellationToken cancel;
  std::thread       stopper([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    cancel.Cancel();
  });

  const auto start = std::chrono::steady_clock::now();
  auto       s     = f.orchestrator.Run(kTarget, items, opts, cancel);
  stopper.join();

  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(20));
  assert(s.stop_reason == StopReason::kCancelled);
  assert(s.attempted == 1);
  assert(s.succeeded == 1);
  assert(f.client->Submitted().size() == 1);
  assert(s.unsent.size() == 3);
  for (std::size_t i = 0; i < s.unsent.size(); ++i) {
    assert(s.unsent[i].reason == danmaku::sender::kReasonManualStop);
    assert(s.unsent[i].dm.msg == "item" + std::to_string(i + 2));
  }
}

void TestAutoStopByCount() {
  Fixture f("auto_stop_count");
  auto    opts          = FastOptions();
  opts.stop_after_count = 2;

  auto              items = Items(5);
  CancellationToken cancel;
  auto              s = f.orchestrator.Run(kTarget, items, opts, cancel);

  assert(s.stop_reason == StopReason::kAutoStopped);
  assert(!s.auto_stop_reason.empty());
  assert(s.succeeded == 2);
  assert(f.client->Submitted().size() == 2);
  assert(cancel.IsCancelled());
  assert(s.unsent.size() == 3);
  for (const auto& u : s.unsent) assert(u.reason == danmaku::sender::kReasonAutoStop);
}

void TestAutoStopByTime() {
  auto client   = std::make_shared<FakeApiClient>();
  auto store    = std::make_shared<SqliteLifecycleStore>(TempStorePath("auto_stop_time"));
  auto fake_now = std::chrono::steady_clock::time_point{};

  // every reading advances the clock by 40 seconds
  SubmissionOrchestrator orchestrator(client, store, nullptr, [&] {
    fake_now += std::chrono::seconds(40);
    return fake_now;
  });

  auto opts                = FastOptions();
  opts.stop_after_time_min = 1;

  auto              items = Items(5);
  CancellationToken cancel;
  auto              s = orchestrator.Run(kTarget, items, opts, cancel);

  assert(s.stop_reason == StopReason::kAutoStopped);
  assert(s.attempted == 2);
  assert(cancel.IsCancelled());
}

void TestPreCancelledRunSendsNothing() {
  Fixture           f("pre_cancelled");
  auto              items = Items(3);
  CancellationToken cancel;
  cancel.Cancel();

  auto s = f.orchestrator.Run(kTarget, items, FastOptions(), cancel);
  assert(s.stop_reason == StopReason::kCancelled);
  assert(s.attempted == 0);
  assert(s.unsent.size() == 3);
  assert(f.client->Submitted().empty());
}

void TestCallbackExceptionsAreContained() {
  Fixture           f("callback_throws");
  auto              items = Items(2);
  CancellationToken cancel;

  auto s = f.orchestrator.Run(
      kTarget, items, FastOptions(), cancel, [](std::size_t, std::size_t) { throw std::runtime_error("progress"); },
      [](const Danmaku&, const danmaku::model::SendResult&) { throw std::runtime_error("result"); });

  assert(s.stop_reason == StopReason::kCompleted);
  assert(s.succeeded == 2);
}

} // namespace

int main() {
  TestAllSucceed();
  TestEmptyBatch();
  TestSkipDuplicatesAcrossRuns();
  TestSkipDisabledSendsEverything();
  TestFatalShortCircuits();
  TestNetworkErrorIsFatal();
  TestNonStandardExceptionIsFatal();
  TestRetryableContinues();
  TestRateLimitCooldownIsCancellable();
  TestCancelDuringPacingWait();
  TestAutoStopByCount();
  TestAutoStopByTime();
  TestPreCancelledRunSendsNothing();
  TestCallbackExceptionsAreContained();

  std::cout << "danmaku_sender_unit_submission_orchestrator: pass\n";
  return 0;
}
