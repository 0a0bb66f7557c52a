#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/compaction/compaction_trigger.hpp"
#include "internal/core/allocation_ledger.hpp"
#include "internal/util/time.hpp"

namespace ledger::factory {

/*
  Runtime

  Owns the long-lived objects of one ledger deployment. The trigger is null
  when compaction is disabled.
*/
struct Runtime {
  std::shared_ptr<core::AllocationLedger>        ledger;
  std::shared_ptr<compaction::CompactionTrigger> compaction;
};

/*
  Maps config to ledger options, applying defaults for unset values.
*/
core::LedgerOptions ResolveLedgerOptions(const ledger::runtime::config::LedgerConfig& config);

double ResolveFragmentationTrigger(const ledger::runtime::config::CompactionConfig& config);

/*
  Build

  Composition root: the only place that turns config into live objects.
*/
Runtime Build(const ledger::runtime::config::RuntimeConfig& config,
              std::shared_ptr<util::Clock> clock = std::make_shared<util::MonotonicClock>());

} // namespace ledger::factory
