#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/danmaku_engine.hpp"
#include "internal/db/api/lifecycle_store.hpp"

namespace danmaku::factory {

/*
  Application

  Owns the long-lived objects of one process.
*/
struct Application {
  std::shared_ptr<db::LifecycleStore>  store;
  std::shared_ptr<core::DanmakuEngine> engine;
};

/*
  Build

  Constructs the engine from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete client and store types.
*/
Application Build(const danmaku::runtime::config::RuntimeConfig& config);

// Store only; commands that never talk to the provider use this.
std::shared_ptr<db::LifecycleStore> BuildStore(const danmaku::runtime::config::RuntimeConfig& config);

} // namespace danmaku::factory
