#include "internal/factory.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/config/config_loader.hpp"

namespace {

using ledger::runtime::config::CompactionConfig;
using ledger::runtime::config::LedgerConfig;
using ledger::runtime::config::RuntimeConfig;
using ledger::util::ManualClock;

void TestDefaults() {
  const auto options = ledger::factory::ResolveLedgerOptions(LedgerConfig{});

  assert(options.max_budget_bytes == 1024ull * 1024 * 1024);
  assert(options.idle_threshold.count() == 300000);
  assert(options.protected_tier == 2);
  assert(options.sweep_interval.count() == 60000);
  assert(options.defragment_threshold == 0.2);

  assert(ledger::factory::ResolveFragmentationTrigger(CompactionConfig{}) == 0.3);
}

void TestBudgetResolution() {
  LedgerConfig config;
  config.set_max_memory_mb(64);
  assert(ledger::factory::ResolveLedgerOptions(config).max_budget_bytes == 64ull * 1024 * 1024);

  // exact bytes win over MiB
  config.set_max_budget_bytes(1000);
  assert(ledger::factory::ResolveLedgerOptions(config).max_budget_bytes == 1000);
}

void TestPolicyOverrides() {
  LedgerConfig config;
  config.set_idle_threshold_ms(1500);
  config.set_protected_tier(0);
  config.set_sweep_interval_ms(250);
  config.set_defragment_threshold(0.0);

  auto options = ledger::factory::ResolveLedgerOptions(config);
  assert(options.idle_threshold.count() == 1500);
  assert(options.protected_tier == 0);
  assert(options.sweep_interval.count() == 250);
  assert(options.defragment_threshold == 0.0);

  config.set_disable_sweep(true);
  options = ledger::factory::ResolveLedgerOptions(config);
  assert(options.sweep_interval.count() == 0);
}

void TestBuildWiresCompaction() {
  const auto config = ledger::config::ConfigLoader::LoadFromYamlString(R"(ledger:
  max_budget_bytes: 4096
  disable_sweep: true
compaction:
  fragmentation_trigger: 0.5
)");

  auto runtime = ledger::factory::Build(config, std::make_shared<ManualClock>());
  assert(runtime.ledger);
  assert(runtime.ledger->MaxBudgetBytes() == 4096);
  assert(runtime.compaction);
  assert(runtime.compaction->FragmentationTrigger() == 0.5);

  auto reservoir = std::make_shared<int>(1);
  auto batch     = std::make_shared<int>(2);
  runtime.ledger->Allocate("root_reservoir", 2048, reservoir, 2);
  runtime.ledger->Allocate("training_0", 1024, batch, 1);
  runtime.ledger->ReportUsage("root_reservoir", 256);
  batch.reset();

  runtime.ledger->SweepNow();
  assert(runtime.compaction->Compactions() == 1);

  runtime.compaction.reset();
  runtime.ledger->Destroy();
}

void TestBuildWithoutCompaction() {
  RuntimeConfig config;
  config.mutable_ledger()->set_disable_sweep(true);
  config.mutable_compaction()->set_enabled(false);

  auto runtime = ledger::factory::Build(config, std::make_shared<ManualClock>());
  assert(runtime.ledger);
  assert(!runtime.compaction);
}

} // namespace

int main() {
  TestDefaults();
  TestBudgetResolution();
  TestPolicyOverrides();
  TestBuildWiresCompaction();
  TestBuildWithoutCompaction();

  std::cout << "ledger_unit_factory: pass\n";
  return 0;
}
