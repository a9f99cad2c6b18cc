#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/config/runtime_options.hpp"
#include "internal/factory.hpp"
#include "internal/listing/listing_codec.hpp"
#include "internal/model/lifecycle_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"
#include "internal/validation/item_validator.hpp"

using danmaku::runtime::config::RuntimeConfig;
using danmaku::util::CancellationToken;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  danmakuctl --config <config.yaml> info <bvid>\n"
            << "  danmakuctl --config <config.yaml> validate <file.xml> [duration_ms]\n"
            << "  danmakuctl --config <config.yaml> send <bvid> <cid> <file.xml> [unsent_out.xml]\n"
            << "  danmakuctl --config <config.yaml> monitor <bvid> <cid>\n"
            << "  danmakuctl --config <config.yaml> sweep <bvid> <cid>\n"
            << "  danmakuctl --config <config.yaml> history [keyword] [pending|verified|lost] [limit]\n";
}

static std::optional<int64_t> ParseInt(const std::string& s) {
  try {
    std::size_t pos   = 0;
    const auto  value = std::stoll(s, &pos);
    if (pos != s.size()) return std::nullopt;
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static void PrintIssues(const std::vector<danmaku::validation::ValidationIssue>& issues) {
  for (const auto& issue : issues) {
    std::cout << "#" << (issue.index + 1) << " [" << danmaku::listing::FormatProgress(issue.item.progress_ms) << "] "
              << issue.item.msg << "\n    " << issue.reason << "\n";
  }
}

// ------------------------------------------------------------

static int CmdInfo(const RuntimeConfig& config, const std::vector<std::string>& args) {
  if (args.size() < 2) return 1;

  auto app  = danmaku::factory::Build(config);
  auto info = app.engine->FetchTargetInfo(args[1]);

  std::cout << "title=" << info.title << "\n";
  std::cout << "duration=" << danmaku::listing::FormatProgress(info.duration_sec * 1000) << "\n";
  for (const auto& part : info.parts) {
    std::cout << "P" << part.page << " cid=" << part.cid << " duration="
              << danmaku::listing::FormatProgress(part.duration_sec * 1000) << " " << part.title << "\n";
  }
  return 0;
}

static int CmdValidate(const RuntimeConfig& config, const std::vector<std::string>& args) {
  if (args.size() < 2) return 1;

  int64_t duration_ms = 0;
  if (args.size() >= 3) {
    auto parsed = ParseInt(args[2]);
    if (!parsed) {
      std::cerr << "invalid duration: " << args[2] << "\n";
      return 1;
    }
    duration_ms = *parsed;
  }

  auto items  = danmaku::listing::ParseListingFile(args[1]);
  auto issues = danmaku::validation::ValidateItems(items, duration_ms, danmaku::config::ToValidatorOptions(config.validator()));

  PrintIssues(issues);
  std::cout << "items=" << items.size() << " issues=" << issues.size() << "\n";
  return 0;
}

static int CmdSend(const RuntimeConfig& config, const std::vector<std::string>& args, CancellationToken& cancel) {
  if (args.size() < 4) return 1;

  auto cid = ParseInt(args[2]);
  if (!cid) {
    std::cerr << "invalid cid: " << args[2] << "\n";
    return 1;
  }

  auto items = danmaku::listing::ParseListingFile(args[3]);
  if (items.empty()) {
    std::cerr << "no items loaded from " << args[3] << "\n";
    return 1;
  }

  auto app      = danmaku::factory::Build(config);
  auto resolved = app.engine->ResolveTarget(args[1], *cid);

  auto issues = app.engine->Validate(items, resolved.part.duration_sec * 1000);
  if (!issues.empty()) {
    std::cerr << issues.size() << " items fail validation and will likely be rejected\n";
  }

  const auto& target = resolved.target;

  auto summary = app.engine->RunSendBatch(
      target, items, danmaku::config::ToSendOptions(config.sender()), cancel,
      [](std::size_t processed, std::size_t total) { std::cout << "progress " << processed << "/" << total << "\n"; });

  std::cout << "stop_reason=" << danmaku::sender::ToString(summary.stop_reason) << "\n";
  if (!summary.auto_stop_reason.empty()) {
    std::cout << "auto_stop_reason=" << summary.auto_stop_reason << "\n";
  }
  std::cout << "total=" << summary.total << " attempted=" << summary.attempted << " succeeded=" << summary.succeeded
            << " failed=" << summary.failed << " skipped=" << summary.skipped << "\n";
  for (const auto& [reason, count] : summary.failure_reasons) {
    std::cout << "  " << reason << ": " << count << "\n";
  }

  if (args.size() >= 5 && !summary.unsent.empty()) {
    if (!danmaku::listing::WriteUnsentXml(summary.unsent, args[4])) {
      std::cerr << "failed to write " << args[4] << "\n";
      return 2;
    }
    std::cout << "unsent written to " << args[4] << "\n";
  }

  return summary.stop_reason == danmaku::sender::StopReason::kFatal ? 2 : 0;
}

static int CmdMonitor(const RuntimeConfig& config, const std::vector<std::string>& args, CancellationToken& cancel) {
  if (args.size() < 3) return 1;

  auto cid = ParseInt(args[2]);
  if (!cid) {
    std::cerr << "invalid cid: " << args[2] << "\n";
    return 1;
  }

  auto app    = danmaku::factory::Build(config);
  auto target = app.engine->ResolveTarget(args[1], *cid).target;

  app.engine->RunMonitor(target, danmaku::config::ToMonitorOptions(config.monitor()), cancel,
                         [](const danmaku::monitor::MonitorStats& s) {
                           std::cout << "total=" << s.total << " verified=" << s.verified << " pending=" << s.pending
                                     << " lost=" << s.lost << std::endl;
                         });
  return 0;
}

static int CmdSweep(const RuntimeConfig& config, const std::vector<std::string>& args) {
  if (args.size() < 3) return 1;

  auto cid = ParseInt(args[2]);
  if (!cid) {
    std::cerr << "invalid cid: " << args[2] << "\n";
    return 1;
  }

  auto app    = danmaku::factory::Build(config);
  auto result = app.engine->Sweep({args[1], *cid, {}});
  if (!result.fetched) {
    std::cerr << "live listing unavailable, nothing marked lost\n";
    return 2;
  }

  std::cout << "live=" << result.live << " verified=" << result.verified << " lost=" << result.lost << "\n";
  return 0;
}

static int CmdHistory(const RuntimeConfig& config, const std::vector<std::string>& args) {
  danmaku::db::model::HistoryQuery query;
  if (args.size() >= 2) query.keyword = args[1];
  if (args.size() >= 3 && args[2] != "all") {
    query.status = danmaku::model::ParseLifecycleStatus(args[2]);
    if (!query.status) {
      std::cerr << "unsupported status: " << args[2] << "\n";
      return 1;
    }
  }
  if (args.size() >= 4) {
    auto limit = ParseInt(args[3]);
    if (!limit || *limit <= 0) {
      std::cerr << "invalid limit: " << args[3] << "\n";
      return 1;
    }
    query.limit = static_cast<uint32_t>(*limit);
  }

  auto store = danmaku::factory::BuildStore(config);
  for (const auto& r : store->QueryHistory(query)) {
    std::cout << r.dmid << " " << danmaku::model::ToString(r.status) << " " << r.bvid << "/" << r.cid << " ["
              << danmaku::listing::FormatProgress(r.progress_ms) << "] " << r.content << "\n";
  }
  return 0;
}

static int RunCommand(const RuntimeConfig& config, const std::vector<std::string>& args, CancellationToken& cancel) {
  const std::string& cmd = args[0];

  try {
    if (cmd == "info") return CmdInfo(config, args);
    if (cmd == "validate") return CmdValidate(config, args);
    if (cmd == "send") return CmdSend(config, args, cancel);
    if (cmd == "monitor") return CmdMonitor(config, args, cancel);
    if (cmd == "sweep") return CmdSweep(config, args);
    if (cmd == "history") return CmdHistory(config, args);
  } catch (const danmaku::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = danmaku::config::ConfigLoader::LoadFromYaml(config_path);
    danmaku::observability::InitializeLogging(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    CancellationToken  cancel;
    std::atomic<bool>  done{false};
    int                rc = 0;
    std::exception_ptr failure;

    std::thread worker([&] {
      try {
        rc = RunCommand(config, args, cancel);
      } catch (const std::exception&) {
        failure = std::current_exception();
      }
      done = true;
    });

    // signal handlers may only touch the flag; translate it here
    while (!done) {
      if (!g_running && !cancel.IsCancelled()) {
        DANMAKU_LOG_INFO("stop requested, finishing current step");
        cancel.Cancel();
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    worker.join();

    if (failure) std::rethrow_exception(failure);
    if (rc == 1) Usage();

    danmaku::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    DANMAKU_LOG_ERROR("Fatal error", {danmaku::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    danmaku::observability::ShutdownLogging();
    return 2;
  }
}
