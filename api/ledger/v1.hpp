#pragma once

#include "config/config.pb.h"

#include "internal/compaction/compaction_trigger.hpp"
#include "internal/core/allocation_ledger.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/events/ledger_event.hpp"
#include "internal/model/allocation_record.hpp"
#include "internal/model/liveness_handle.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::v1 {
using ::ledger::compaction::CompactionTrigger;
using ::ledger::core::AllocationLedger;
using ::ledger::core::LedgerOptions;
using ::ledger::events::EventBus;
using ::ledger::events::EventType;
using ::ledger::events::LedgerEvent;
using ::ledger::model::AllocationRecord;
using ::ledger::model::LedgerStats;
using ::ledger::model::LivenessHandle;
using ::ledger::model::MakeWeakHandle;
using ::ledger::runtime::config::RuntimeConfig;
} // namespace ledger::v1
