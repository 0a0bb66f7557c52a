#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "internal/events/event_bus.hpp"

namespace ledger::core {
class AllocationLedger;
}

namespace ledger::compaction {

/*
  Orchestrator-side policy: after every sweep that reclaimed bytes, compact
  the ledger if fragmentation exceeds the trigger ratio.

  Runs on whichever thread published SweepComplete (normally the sweeper).
  Create through Attach(); the subscription is dropped on destruction.
*/
class CompactionTrigger : public std::enable_shared_from_this<CompactionTrigger> {
 public:
  static constexpr double kDefaultFragmentationTrigger = 0.3;

  static std::shared_ptr<CompactionTrigger> Attach(std::shared_ptr<core::AllocationLedger> ledger,
                                                   double fragmentation_trigger = kDefaultFragmentationTrigger);

  ~CompactionTrigger();

  CompactionTrigger(const CompactionTrigger&)            = delete;
  CompactionTrigger& operator=(const CompactionTrigger&) = delete;

  // Exposed for callers that drive sweeps themselves.
  void OnEvent(const events::LedgerEvent& event);

  std::uint64_t Compactions() const {
    return compactions_;
  }

  double FragmentationTrigger() const {
    return fragmentation_trigger_;
  }

 private:
  CompactionTrigger(std::shared_ptr<core::AllocationLedger> ledger, double fragmentation_trigger);

  std::shared_ptr<core::AllocationLedger> ledger_;
  double                                  fragmentation_trigger_;
  events::EventBus::SubscriptionId        subscription_ = 0;
  std::atomic<std::uint64_t>              compactions_{0};
};

} // namespace ledger::compaction
