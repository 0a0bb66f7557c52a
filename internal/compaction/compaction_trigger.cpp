#include "compaction_trigger.hpp"

#include <exception>

#include "internal/core/allocation_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::compaction {

using observability::DoubleField;
using observability::StringField;
using observability::UintField;

CompactionTrigger::CompactionTrigger(std::shared_ptr<core::AllocationLedger> ledger, double fragmentation_trigger)
    : ledger_(std::move(ledger)), fragmentation_trigger_(fragmentation_trigger) {
}

std::shared_ptr<CompactionTrigger> CompactionTrigger::Attach(std::shared_ptr<core::AllocationLedger> ledger, double fragmentation_trigger) {
  if (!ledger) {
    throw util::InvalidArgument("compaction trigger requires a ledger");
  }
  if (fragmentation_trigger < 0.0 || fragmentation_trigger > 1.0) {
    throw util::InvalidArgument("fragmentation trigger must be within [0, 1]");
  }

  std::shared_ptr<CompactionTrigger> trigger(new CompactionTrigger(std::move(ledger), fragmentation_trigger));

  std::weak_ptr<CompactionTrigger> weak = trigger;
  trigger->subscription_                = trigger->ledger_->Subscribe([weak](const events::LedgerEvent& event) {
    if (auto self = weak.lock()) self->OnEvent(event);
  });
  return trigger;
}

CompactionTrigger::~CompactionTrigger() {
  if (subscription_ != 0) ledger_->Unsubscribe(subscription_);
}

void CompactionTrigger::OnEvent(const events::LedgerEvent& event) {
  if (event.type != events::EventType::kSweepComplete) return;

  try {
    const auto stats = ledger_->GetStats();
    LEDGER_LOG_DEBUG("Sweep reclaimed bytes", {UintField("freed_bytes", event.freed_bytes), DoubleField("fragmentation_ratio", stats.fragmentation_ratio)});

    if (stats.fragmentation_ratio <= fragmentation_trigger_) return;

    // the ledger's own threshold may still veto the rebuild
    if (ledger_->Defragment()) ++compactions_;
  } catch (const util::LedgerTerminated& e) {
    // raced with Destroy(); nothing left to compact
    LEDGER_LOG_DEBUG("Compaction skipped", {StringField("reason", e.what())});
  }
}

} // namespace ledger::compaction
