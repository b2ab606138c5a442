#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using bidsub::observability::IntField;
using bidsub::observability::StringField;

namespace {

constexpr auto kShutdownGrace = std::chrono::seconds(30);

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void PrintUsage() {
  std::cerr << "Usage: bid-submitter [--check] <config.yaml> OR bid-submitter [--check] --config <config.yaml>" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool        check_only = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check") {
      check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (config_path.empty() && arg.rfind("--", 0) != 0) {
      config_path = arg;
    } else {
      PrintUsage();
      return 1;
    }
  }
  if (config_path.empty()) {
    PrintUsage();
    return 1;
  }

  try {
    auto config = bidsub::config::ConfigLoader::LoadFromYaml(config_path);
    bidsub::observability::InitializeLogging(config);

    // Builds the store, portals and orchestrator and hydrates persisted jobs.
    auto app = bidsub::factory::Build(config);

    if (check_only) {
      for (const auto& name : app.portals->Names()) {
        std::cout << "portal " << name << " ok" << std::endl;
      }
      app.notifications->Stop();
      bidsub::observability::ShutdownLogging();
      return 0;
    }

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.orchestrator->Start();
    app.ticker->Start();

    const auto stats = app.orchestrator->GetStatistics();
    BIDSUB_LOG_INFO("Bid submitter started", {IntField("portals", static_cast<int64_t>(app.portals->Names().size())),
                                              IntField("queued", static_cast<int64_t>(stats.queued())),
                                              IntField("failed", static_cast<int64_t>(stats.failed()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    BIDSUB_LOG_INFO("Shutting down bid submitter", {IntField("in_flight", static_cast<int64_t>(app.orchestrator->InFlightCount()))});

    // no new admissions; let running deliveries record their outcome
    app.ticker->Stop();
    if (!app.orchestrator->WaitForIdle(kShutdownGrace)) {
      BIDSUB_LOG_WARN("deliveries still in flight after grace period",
                      {IntField("in_flight", static_cast<int64_t>(app.orchestrator->InFlightCount()))});
    }
    app.orchestrator->Stop();
    app.notifications->Stop();
    bidsub::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    BIDSUB_LOG_ERROR("Fatal error", {StringField("config", config_path), StringField("error", e.what())});
    bidsub::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
