#include "factory.hpp"

#include <memory>

#include "internal/client/curl_api_client.hpp"
#include "internal/config/runtime_options.hpp"
#include "internal/db/sqlite/sqlite_lifecycle_store.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"

namespace danmaku::factory {

std::shared_ptr<db::LifecycleStore> BuildStore(const danmaku::runtime::config::RuntimeConfig& config) {
  const auto path = config::StorePath(config);
  DANMAKU_LOG_DEBUG("opening lifecycle store", {danmaku::observability::StringField("path", path)});
  return std::make_shared<db::sqlite::SqliteLifecycleStore>(path);
}

/*
    Build full application dependency graph
*/
Application Build(const danmaku::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.store = BuildStore(config);

  // ------------------------------------------------------------------
  // Provider client
  // ------------------------------------------------------------------
  auto client = std::make_shared<client::CurlApiClient>(config::ToClientOptions(config));

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  auto notifier = std::make_shared<notify::LogNotifier>();
  app.engine    = std::make_shared<core::DanmakuEngine>(client, app.store, notifier,
                                                     config::ToValidatorOptions(config.validator()));

  return app;
}

} // namespace danmaku::factory
