#include "internal/monitor/reconciliation_monitor.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/db/sqlite/sqlite_lifecycle_store.hpp"
#include "tests/support/fake_api_client.hpp"

using danmaku::db::sqlite::SqliteLifecycleStore;
using danmaku::model::Danmaku;
using danmaku::model::LifecycleStatus;
using danmaku::model::VideoTarget;
using danmaku::monitor::MonitorOptions;
using danmaku::monitor::MonitorStats;
using danmaku::monitor::ReconciliationMonitor;
using danmaku::testing::FakeApiClient;
using danmaku::testing::TempStorePath;

namespace {

const VideoTarget kTarget{"BV1monitor", 31337, ""};

// Online listing: provider id at p[7].
const char* kListingAC =
    R"(<?xml version="1.0" encoding="UTF-8"?><i><chatserver>chat.bilibili.com</chatserver>)"
    R"(<d p="1.000,1,25,16777215,1700000000,0,abcd1234,A,11">a</d>)"
    R"(<d p="3.000,1,25,16777215,1700000002,0,abcd1234,C,11">c</d>)"
    R"(<d p="9.000,1,25,16777215,1700000009,0,ffff0000,OTHER,11">someone else</d></i>)";

Danmaku Item(const std::string& msg, int64_t progress_ms, const std::string& dmid) {
  Danmaku dm;
  dm.msg         = msg;
  dm.progress_ms = progress_ms;
  dm.dmid        = dmid;
  return dm;
}

std::shared_ptr<SqliteLifecycleStore> SeededStore(const std::string& name) {
  auto store = std::make_shared<SqliteLifecycleStore>(TempStorePath(name));
  store->RecordAccepted(kTarget, Item("a", 1000, "A"), true);
  store->RecordAccepted(kTarget, Item("b", 2000, "B"), true);
  store->RecordAccepted(kTarget, Item("c", 3000, "C"), true);
  return store;
}

void TestTickVerifiesOnly() {
  auto client = std::make_shared<FakeApiClient>();
  auto store  = SeededStore("tick_verifies");
  client->SetListing(kListingAC);

  ReconciliationMonitor monitor(client, store);
  auto                  stats = monitor.Tick(kTarget);

  assert(stats.total == 3);
  assert(stats.verified == 2);
  assert(stats.pending == 1);
  assert(stats.lost == 0);
  assert(store->Get("B")->status == LifecycleStatus::kPending);
}

void TestFetchFailureLeavesStateAlone() {
  auto client = std::make_shared<FakeApiClient>();
  auto store  = SeededStore("fetch_failure");
  client->FailListing();

  ReconciliationMonitor monitor(client, store);
  auto                  stats = monitor.Tick(kTarget);
  assert(stats.pending == 3);

  auto sweep = monitor.Sweep(kTarget);
  assert(!sweep.fetched);
  assert(sweep.lost == 0);
  assert(store->GetStats(kTarget.cid).lost == 0);
}

void TestGarbageListingIsAFetchFailure() {
  auto client = std::make_shared<FakeApiClient>();
  auto store  = SeededStore("garbage_listing");
  client->SetListing("<html>rate limited</html>");

  ReconciliationMonitor monitor(client, store);
  auto                  sweep = monitor.Sweep(kTarget);
  assert(!sweep.fetched);
  assert(store->GetStats(kTarget.cid).lost == 0);
}

void TestHtmlPageWithItalicsIsAFetchFailure() {
  auto client = std::make_shared<FakeApiClient>();
  auto store  = SeededStore("html_italics");
  client->SetListing("<html><body><i>service busy, retry later</i></body></html>");

  ReconciliationMonitor monitor(client, store);
  auto                  sweep = monitor.Sweep(kTarget);
  assert(!sweep.fetched);
  assert(sweep.lost == 0);

  const auto stats = store->GetStats(kTarget.cid);
  assert(stats.lost == 0);
  assert(stats.Pending() == 3);
}

void TestTruncatedListingIsAFetchFailure() {
  auto client = std::make_shared<FakeApiClient>();
  auto store  = SeededStore("truncated_listing");
  // cut off inside C's record
  client->SetListing(R"(<i><d p="1.000,1,25,16777215,1700000000,0,abcd1234,A,11">a</d>)"
                     R"(<d p="3.000,1,25,16777215,1700000002,0,abcd12)");

  ReconciliationMonitor monitor(client, store);
  auto                  sweep = monitor.Sweep(kTarget);
  assert(!sweep.fetched);
  assert(sweep.lost == 0);
  assert(store->Get("A")->status == LifecycleStatus::kPending);
  assert(store->Get("C")->status == LifecycleStatus::kPending);
  assert(store->GetStats(kTarget.cid).lost == 0);
}

void TestSweepMarksMissingLost() {
  auto client = std::make_shared<FakeApiClient>();
  auto store  = SeededStore("sweep");
  client->SetListing(kListingAC);

  ReconciliationMonitor monitor(client, store);
  auto                  sweep = monitor.Sweep(kTarget);

  assert(sweep.fetched);
  assert(sweep.live == 3);
  assert(sweep.verified == 2);
  assert(sweep.lost == 1);
  assert(store->Get("B")->status == LifecycleStatus::kLost);
  assert(store->Get("A")->status == LifecycleStatus::kVerified);
}

void TestEmptyListingSweepMarksAllPendingLost() {
  auto client = std::make_shared<FakeApiClient>();
  auto store  = SeededStore("empty_listing");
  client->SetListing("<i></i>");

  ReconciliationMonitor monitor(client, store);
  auto                  sweep = monitor.Sweep(kTarget);
  assert(sweep.fetched);
  assert(sweep.lost == 3);
}

void TestRunReportsUntilCancelled() {
  auto client = std::make_shared<FakeApiClient>();
  auto store  = SeededStore("run_loop");
  client->SetListing(kListingAC);

  ReconciliationMonitor       monitor(client, store);
  danmaku::util::CancellationToken cancel;
  MonitorOptions              opts;
  opts.refresh_interval = std::chrono::seconds(60);

  std::vector<MonitorStats> reports;
  std::thread               runner([&] {
    monitor.Run(kTarget, opts, cancel, [&](const MonitorStats& s) {
      reports.push_back(s);
      cancel.Cancel();
    });
  });
  runner.join();

  assert(reports.size() == 1);
  assert(reports[0].verified == 2);
  assert(client->ListingFetches() == 1);
}

} // namespace

int main() {
  TestTickVerifiesOnly();
  TestFetchFailureLeavesStateAlone();
  TestGarbageListingIsAFetchFailure();
  TestHtmlPageWithItalicsIsAFetchFailure();
  TestTruncatedListingIsAFetchFailure();
  TestSweepMarksMissingLost();
  TestEmptyListingSweepMarksAllPendingLost();
  TestRunReportsUntilCancelled();

  std::cout << "danmaku_sender_unit_reconciliation_monitor: pass\n";
  return 0;
}
