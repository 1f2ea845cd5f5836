#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/llm/provider.hpp"
#include "internal/storage/artifact_store.hpp"

namespace jobmeter::modules {
class ModuleRegistry;
class GlossaryStore;
class ModuleSettingsStore;
} // namespace jobmeter::modules
namespace jobmeter::store {
class JobStore;
}
namespace jobmeter::usage {
class UsageLedger;
class QuotaPolicy;
} // namespace jobmeter::usage
namespace jobmeter::history {
class HistoryIndex;
}
namespace jobmeter::worker {
class JobScheduler;
class JobWorker;
class JobRunner;
} // namespace jobmeter::worker
namespace jobmeter::core {
class JobEngine;
}
namespace jobmeter::retention {
class RetentionSweeper;
}

namespace jobmeter::factory {

/*
  Application

  Owns every long-lived component. Everything here lives for the
  lifetime of the process.

  scheduler, runner and workers exist only when an LLM provider was
  supplied; without one the engine serves reads and admin calls and
  refuses submissions.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<modules::ModuleRegistry>      registry;
  std::shared_ptr<store::JobStore>              store;
  std::shared_ptr<usage::UsageLedger>           ledger;
  std::shared_ptr<usage::QuotaPolicy>           quota;
  std::shared_ptr<modules::ModuleSettingsStore> settings;
  std::shared_ptr<modules::GlossaryStore>       glossary;
  storage::ArtifactStorePtr                     artifacts;
  std::shared_ptr<history::HistoryIndex>        history;

  std::shared_ptr<worker::JobScheduler>            scheduler;
  std::shared_ptr<worker::JobRunner>               runner;
  std::vector<std::shared_ptr<worker::JobWorker>>  workers;

  std::shared_ptr<core::JobEngine>             engine;
  std::shared_ptr<retention::RetentionSweeper> sweeper;

  // Stops the sweeper, then drains the job queue and joins workers.
  void Shutdown();
};

/*
  Build

  Composition root. The ONLY place allowed to know concrete DB and
  storage types. Bootstraps the schema of the selected backend for every
  registered module and starts the job workers; the sweeper is left for
  the caller to start.
*/
Application Build(const jobmeter::runtime::config::RuntimeConfig& config, std::shared_ptr<llm::Provider> provider = nullptr);

} // namespace jobmeter::factory
