#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/event_store.hpp"
#include "internal/projection/projection_worker.hpp"

namespace ledger::factory {

/*
  Runtime

  Owns the long-lived components built from one RuntimeConfig.
  The worker, when present, is stopped before the store goes away.
*/
struct Runtime {
  std::shared_ptr<core::EventStore>             store;
  std::shared_ptr<projection::ProjectionWorker> worker;

  Runtime() = default;
  Runtime(Runtime&&) noexcept = default;
  Runtime& operator=(Runtime&&) noexcept = default;
  ~Runtime();
};

// Config sections mapped onto component options; zero values keep the defaults.
core::EventStoreOptions ToOptions(const ledger::runtime::config::RuntimeConfig& config);

/*
  BuildRuntime

  Composition root. The ONLY place allowed to know concrete DB types.

  Projections are registered by the caller on runtime.store; call
  Start() afterwards to hydrate the DLQ, catch up and start the worker.
*/
Runtime BuildRuntime(const ledger::runtime::config::RuntimeConfig& config);

void Start(Runtime& runtime, const ledger::runtime::config::RuntimeConfig& config);

} // namespace ledger::factory
