#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/modules/module_settings.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/retention/retention_sweeper.hpp"
#include "internal/util/time.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  jobmeter::observability::ShutdownLogging();
  jobmeter::observability::ShutdownMetrics();
  jobmeter::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: jobmeter <config.yaml> OR jobmeter --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = jobmeter::config::ConfigLoader::LoadFromYaml(config_path);

    jobmeter::observability::InitializeTracing(config);
    jobmeter::observability::InitializeMetrics(config);
    jobmeter::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = jobmeter::factory::Build(config);
    app.settings->EnsureDefaults(jobmeter::util::Now());

    // Register signal handlers before the sweeper thread starts.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.sweeper->Start();
    JOBMETER_LOG_INFO("jobmeter started", {jobmeter::observability::StringField("config", config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    JOBMETER_LOG_INFO("Shutting down jobmeter");

    app.Shutdown();
    ShutdownObservability();
  } catch (const std::exception& e) {
    JOBMETER_LOG_ERROR("Fatal error", {jobmeter::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
