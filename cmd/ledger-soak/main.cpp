#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <deque>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

using ledger::observability::DoubleField;
using ledger::observability::StringField;
using ledger::observability::UintField;

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

// Stand-ins for the long-lived cognitive components the ledger accounts for.
struct Component {
  std::string         name;
  std::vector<double> state;
};

struct TrainingBatch {
  std::vector<double> inputs;
  std::vector<double> targets;
};

std::shared_ptr<Component> MakeComponent(const std::string& name, std::uint64_t size_bytes) {
  auto component  = std::make_shared<Component>();
  component->name = name;
  component->state.resize(size_bytes / sizeof(double));
  return component;
}

void LogStats(const ledger::core::AllocationLedger& tracker, std::uint64_t tick) {
  const auto stats = tracker.GetStats();
  LEDGER_LOG_INFO("Ledger stats", {UintField("tick", tick), UintField("allocated", stats.total_allocated), UintField("used", stats.total_used),
                                   UintField("blocks", stats.block_count), DoubleField("fragmentation", stats.fragmentation_ratio),
                                   DoubleField("utilization", stats.average_utilization)});
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc != 1) {
    std::cerr << "Usage: ledger-soak [config.yaml] OR ledger-soak --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? ledger::runtime::config::RuntimeConfig{} : ledger::config::ConfigLoader::LoadFromYaml(config_path);

    ledger::observability::InitializeMetrics(config);
    ledger::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build ledger (dependency graph)
    // ------------------------------------------------------------
    auto        runtime = ledger::factory::Build(config);
    auto&       tracker = *runtime.ledger;
    const auto& soak    = config.soak();

    const auto      budget         = tracker.MaxBudgetBytes();
    const auto      batch_bytes    = soak.batch_bytes() > 0 ? soak.batch_bytes() : std::max<std::uint64_t>(budget / 64, 1);
    const auto      batch_lifetime = soak.batch_lifetime_ticks() > 0 ? soak.batch_lifetime_ticks() : 8u;
    const auto      report_every   = soak.report_every_ticks() > 0 ? soak.report_every_ticks() : 50u;
    const auto      tick           = std::chrono::milliseconds(soak.tick_ms() > 0 ? soak.tick_ms() : 20);
    std::mt19937_64 rng(soak.seed() > 0 ? soak.seed() : 42);

    // Protected components are owned here for the whole run.
    auto root_reservoir = MakeComponent("root_reservoir", budget / 8);
    auto p_system       = MakeComponent("p_system", budget / 16);
    auto hypergraph     = MakeComponent("hypergraph", budget / 16);
    tracker.Allocate(root_reservoir->name, budget / 8, root_reservoir, 2);
    tracker.Allocate(p_system->name, budget / 16, p_system, 2);
    tracker.Allocate(hypergraph->name, budget / 16, hypergraph, 1);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    LEDGER_LOG_INFO("Soak started", {UintField("budget_bytes", budget), UintField("batch_bytes", batch_bytes),
                                     UintField("iterations", soak.iterations())});

    std::deque<std::shared_ptr<TrainingBatch>> owned_batches;
    std::uint64_t                              rejected = 0;

    for (std::uint64_t i = 0; g_running && (soak.iterations() == 0 || i < soak.iterations()); ++i) {
      auto batch = std::make_shared<TrainingBatch>();
      batch->inputs.resize(batch_bytes / sizeof(double) / 2);
      batch->targets.resize(batch_bytes / sizeof(double) / 2);

      const auto id = "training_" + std::to_string(i);
      try {
        tracker.Allocate(id, batch_bytes, batch, 1);
        // batches rarely fill their reservation
        std::uniform_int_distribution<std::uint64_t> usage(batch_bytes / 2, batch_bytes);
        tracker.ReportUsage(id, usage(rng));
        owned_batches.push_back(std::move(batch));
      } catch (const ledger::util::InsufficientBudget& e) {
        ++rejected;
        LEDGER_LOG_WARN("Training batch rejected", {StringField("id", id), StringField("error", e.what())});
      }

      // the owner lets go of old batches; the ledger notices on its next sweep
      while (owned_batches.size() > batch_lifetime) owned_batches.pop_front();

      tracker.Access<Component>(root_reservoir->name);

      if ((i + 1) % report_every == 0) LogStats(tracker, i + 1);
      std::this_thread::sleep_for(tick);
    }

    LogStats(tracker, 0);
    LEDGER_LOG_INFO("Soak finished", {UintField("rejected", rejected),
                                      UintField("compactions", runtime.compaction ? runtime.compaction->Compactions() : 0)});

    runtime.compaction.reset();
    tracker.Destroy();
    ledger::observability::ShutdownLogging();
    ledger::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    LEDGER_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ledger::observability::ShutdownLogging();
    ledger::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
