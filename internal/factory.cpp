#include "factory.hpp"

#include "internal/observability/logging.hpp"

namespace ledger::factory {

using ledger::runtime::config::CompactionConfig;
using ledger::runtime::config::LedgerConfig;
using ledger::runtime::config::RuntimeConfig;

namespace {

constexpr std::uint64_t kDefaultMemoryMb = 1024;

} // namespace

core::LedgerOptions ResolveLedgerOptions(const LedgerConfig& config) {
  core::LedgerOptions options;

  if (config.max_budget_bytes() > 0) {
    options.max_budget_bytes = config.max_budget_bytes();
  } else {
    const auto mb            = config.max_memory_mb() > 0 ? config.max_memory_mb() : kDefaultMemoryMb;
    options.max_budget_bytes = mb * 1024 * 1024;
  }

  if (config.idle_threshold_ms() > 0) {
    options.idle_threshold = util::Millis(config.idle_threshold_ms());
  }
  if (config.has_protected_tier()) {
    options.protected_tier = config.protected_tier();
  }

  if (config.disable_sweep()) {
    options.sweep_interval = util::Millis(0);
  } else if (config.sweep_interval_ms() > 0) {
    options.sweep_interval = util::Millis(config.sweep_interval_ms());
  }

  if (config.has_defragment_threshold()) {
    options.defragment_threshold = config.defragment_threshold();
  }

  return options;
}

double ResolveFragmentationTrigger(const CompactionConfig& config) {
  return config.has_fragmentation_trigger() ? config.fragmentation_trigger() : compaction::CompactionTrigger::kDefaultFragmentationTrigger;
}

Runtime Build(const RuntimeConfig& config, std::shared_ptr<util::Clock> clock) {
  Runtime runtime;
  runtime.ledger = std::make_shared<core::AllocationLedger>(ResolveLedgerOptions(config.ledger()), std::move(clock));

  const bool compaction_enabled = !config.compaction().has_enabled() || config.compaction().enabled();
  if (compaction_enabled) {
    runtime.compaction = compaction::CompactionTrigger::Attach(runtime.ledger, ResolveFragmentationTrigger(config.compaction()));
  }

  LEDGER_LOG_INFO("Ledger runtime built", {observability::BoolField("compaction", compaction_enabled)});
  return runtime;
}

} // namespace ledger::factory
