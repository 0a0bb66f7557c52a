#include "internal/compaction/compaction_trigger.hpp"
#include "internal/core/allocation_ledger.hpp"

#include <cassert>
#include <iostream>
#include <memory>

namespace {

using ledger::compaction::CompactionTrigger;
using ledger::core::AllocationLedger;
using ledger::core::LedgerOptions;
using ledger::events::LedgerEvent;
using ledger::util::ManualClock;
using ledger::util::Millis;

std::shared_ptr<AllocationLedger> MakeLedger(double defragment_threshold = 0.2) {
  LedgerOptions options;
  options.max_budget_bytes     = 1000;
  options.sweep_interval       = Millis(0);
  options.defragment_threshold = defragment_threshold;
  return std::make_shared<AllocationLedger>(options, std::make_shared<ManualClock>());
}

void TestCompactsWhenSweepLeavesLedgerFragmented() {
  auto tracker = MakeLedger();
  auto trigger = CompactionTrigger::Attach(tracker);

  auto reservoir = std::make_shared<int>(1);
  auto batch     = std::make_shared<int>(2);
  tracker->Allocate("reservoir", 500, reservoir, 2);
  tracker->Allocate("batch", 300, batch, 0);
  tracker->ReportUsage("reservoir", 100);
  batch.reset();

  assert(tracker->SweepNow() == 300);

  assert(trigger->Compactions() == 1);
  assert(tracker->Find("reservoir")->used_bytes == 500);
  assert(tracker->GetStats().fragmentation_ratio == 0.0);
}

void TestLeavesLedgerAloneBelowTrigger() {
  auto tracker = MakeLedger();
  auto trigger = CompactionTrigger::Attach(tracker, 0.5);
  assert(trigger->FragmentationTrigger() == 0.5);

  auto reservoir = std::make_shared<int>(1);
  auto batch     = std::make_shared<int>(2);
  tracker->Allocate("reservoir", 500, reservoir, 2);
  tracker->Allocate("batch", 300, batch, 0);
  tracker->ReportUsage("reservoir", 300);
  batch.reset();

  // 1 - 300/500 = 0.4
  tracker->SweepNow();
  assert(trigger->Compactions() == 0);
  assert(tracker->Find("reservoir")->used_bytes == 300);
}

void TestSkippedRebuildIsNotCounted() {
  auto tracker = MakeLedger(0.9);
  auto trigger = CompactionTrigger::Attach(tracker);

  auto reservoir = std::make_shared<int>(1);
  auto batch     = std::make_shared<int>(2);
  tracker->Allocate("reservoir", 500, reservoir, 2);
  tracker->Allocate("batch", 300, batch, 0);
  tracker->ReportUsage("reservoir", 100);
  batch.reset();

  // 0.8 is above the trigger but below the ledger's own threshold
  tracker->SweepNow();
  assert(trigger->Compactions() == 0);
  assert(tracker->Find("reservoir")->used_bytes == 100);
}

void TestIgnoresOtherEvents() {
  auto tracker = MakeLedger();
  auto trigger = CompactionTrigger::Attach(tracker);

  auto reservoir = std::make_shared<int>(1);
  tracker->Allocate("reservoir", 500, reservoir, 2);
  tracker->ReportUsage("reservoir", 10);
  tracker->Release("reservoir");

  trigger->OnEvent(LedgerEvent::Allocated("reservoir", 500));
  assert(trigger->Compactions() == 0);
}

void TestDetachesOnDestruction() {
  auto tracker = MakeLedger();
  auto trigger = CompactionTrigger::Attach(tracker);

  auto reservoir = std::make_shared<int>(1);
  auto batch     = std::make_shared<int>(2);
  tracker->Allocate("reservoir", 500, reservoir, 2);
  tracker->Allocate("batch", 300, batch, 0);
  tracker->ReportUsage("reservoir", 100);
  batch.reset();

  trigger.reset();
  tracker->SweepNow();
  assert(tracker->Find("reservoir")->used_bytes == 100);
}

void TestSurvivesLedgerTeardown() {
  auto tracker = MakeLedger();
  auto trigger = CompactionTrigger::Attach(tracker);

  tracker->Destroy();
  trigger->OnEvent(LedgerEvent::SweepComplete(100));
  assert(trigger->Compactions() == 0);

  // unsubscribing from a destroyed ledger is allowed
  trigger.reset();
}

void TestAttachValidatesArguments() {
  bool threw = false;
  try {
    (void)CompactionTrigger::Attach(nullptr);
  } catch (const ledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)CompactionTrigger::Attach(MakeLedger(), 1.5);
  } catch (const ledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCompactsWhenSweepLeavesLedgerFragmented();
  TestLeavesLedgerAloneBelowTrigger();
  TestSkippedRebuildIsNotCounted();
  TestIgnoresOtherEvents();
  TestDetachesOnDestruction();
  TestSurvivesLedgerTeardown();
  TestAttachValidatesArguments();

  std::cout << "ledger_unit_compaction_trigger: pass\n";
  return 0;
}
