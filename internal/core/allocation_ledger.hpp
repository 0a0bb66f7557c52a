#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

#include "internal/core/eviction_policy.hpp"
#include "internal/core/liveness_sweeper.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/model/allocation_record.hpp"
#include "internal/model/liveness_handle.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::core {

struct LedgerOptions {
  std::uint64_t max_budget_bytes = 1024ull * 1024 * 1024;

  util::Millis  idle_threshold{300000};
  std::uint32_t protected_tier = 2;

  // Zero disables the background sweep; SweepNow() still works.
  util::Millis sweep_interval{60000};

  double defragment_threshold = 0.2;
};

/*
  Budget-constrained accounting of externally owned payloads.

  The ledger holds only weak references: a payload lives exactly as long as
  its owner keeps it. Every public operation runs to completion under one
  mutex; events are published after the mutex is released, on the calling
  thread (the sweeper thread for SweepComplete), so handlers may call back
  into the ledger.

  Invariant: the sum of size_bytes over all records never exceeds
  max_budget_bytes once an operation has returned.
*/
class AllocationLedger {
 public:
  static constexpr std::uint32_t kDefaultTier = 1;

  explicit AllocationLedger(LedgerOptions options, std::shared_ptr<util::Clock> clock = std::make_shared<util::MonotonicClock>());
  ~AllocationLedger();

  AllocationLedger(const AllocationLedger&)            = delete;
  AllocationLedger& operator=(const AllocationLedger&) = delete;

  // Tracks payload under id, evicting idle low-priority or dead records when
  // the budget is short. Reusing an id replaces the previous record.
  // Throws InsufficientBudget, InvalidArgument, LedgerTerminated.
  template <typename T>
  void Allocate(const std::string& id, std::uint64_t size_bytes, const std::shared_ptr<T>& payload, std::uint32_t priority_tier = kDefaultTier) {
    AllocateHandle(id, size_bytes, payload ? model::MakeWeakHandle(payload) : nullptr, priority_tier);
  }

  void AllocateHandle(const std::string& id, std::uint64_t size_bytes, std::shared_ptr<model::LivenessHandle> handle,
                      std::uint32_t priority_tier = kDefaultTier);

  // Throws NotFound, Reclaimed (record removed), LedgerTerminated.
  std::shared_ptr<const void> Access(const std::string& id);

  // Same as Access(id), additionally throws TypeMismatch.
  template <typename T>
  std::shared_ptr<const T> Access(const std::string& id) {
    return std::static_pointer_cast<const T>(AccessImpl(id, std::type_index(typeid(T))));
  }

  void Release(const std::string& id);

  // Owner-reported utilization; lowers used_bytes for fragmentation stats.
  void ReportUsage(const std::string& id, std::uint64_t used_bytes);

  model::LedgerStats GetStats() const;

  bool Contains(const std::string& id) const;

  std::optional<model::AllocationRecord> Find(const std::string& id) const;

  // Rebuilds the table from live records when fragmentation is at or above
  // the threshold. Reinsertion may drop low-priority records. Returns false
  // when the ledger was below the threshold and left untouched.
  bool Defragment();

  // One synchronous liveness pass. Returns the bytes reclaimed.
  std::uint64_t SweepNow();

  // Publishes Destroyed to current subscribers. Dropping the ledger without
  // calling Destroy() tears it down silently.
  void Destroy();

  bool Terminated() const;

  events::EventBus::SubscriptionId Subscribe(events::EventBus::Handler handler);

  // Allowed after Destroy() so observers can detach unconditionally.
  bool Unsubscribe(events::EventBus::SubscriptionId id);

  std::uint64_t MaxBudgetBytes() const {
    return options_.max_budget_bytes;
  }

  const LedgerOptions& options() const {
    return options_;
  }

 private:
  using RecordMap = EvictionPolicy::RecordMap;
  using EventList = std::vector<events::LedgerEvent>;

  std::shared_ptr<const void> AccessImpl(const std::string& id, std::optional<std::type_index> expected);

  void ThrowIfTerminatedLocked(std::string_view op) const;

  void AllocateLocked(const std::string& id, std::uint64_t size_bytes, std::shared_ptr<model::LivenessHandle> handle, std::uint32_t priority_tier,
                      EventList& pending);
  void FreeUpSpaceLocked(std::uint64_t required_bytes, util::TimePoint now, const std::string& exclude_id, EventList& pending);
  std::uint64_t SweepLocked(EventList& pending);

  void InsertLocked(model::AllocationRecord record);
  void EraseLocked(RecordMap::iterator it);
  void ResetTotalsLocked();

  model::LedgerStats StatsLocked() const;

  void SweepOnce();

  LedgerOptions                options_;
  std::shared_ptr<util::Clock> clock_;
  EvictionPolicy               policy_;

  mutable std::mutex mutex_;
  RecordMap          records_;
  std::uint64_t      total_allocated_ = 0;
  std::uint64_t      total_used_      = 0;
  bool               terminated_      = false;

  // Serializes Destroy() callers.
  std::mutex lifecycle_mutex_;

  events::EventBus bus_;

  // Declared last: stopped before any other member is torn down.
  std::unique_ptr<LivenessSweeper> sweeper_;
};

} // namespace ledger::core
