#include "allocation_ledger.hpp"

#include <algorithm>
#include <exception>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace ledger::core {

using observability::DoubleField;
using observability::StringField;
using observability::UintField;

namespace {

EvictionPolicy::Options PolicyOptions(const LedgerOptions& options) {
  EvictionPolicy::Options policy;
  policy.idle_threshold = options.idle_threshold;
  policy.protected_tier = options.protected_tier;
  return policy;
}

bool Exceeds(std::uint64_t current, std::uint64_t adding, std::uint64_t budget) {
  return adding > budget || current > budget - adding;
}

} // namespace

AllocationLedger::AllocationLedger(LedgerOptions options, std::shared_ptr<util::Clock> clock)
    : options_(options), clock_(std::move(clock)), policy_(PolicyOptions(options)) {
  if (!clock_) {
    throw util::InvalidArgument("ledger requires a clock");
  }
  if (options_.max_budget_bytes == 0) {
    throw util::InvalidArgument("ledger budget must be positive");
  }
  if (options_.defragment_threshold < 0.0 || options_.defragment_threshold > 1.0) {
    throw util::InvalidArgument("defragment threshold must be within [0, 1]");
  }

  if (options_.sweep_interval.count() > 0) {
    sweeper_ = std::make_unique<LivenessSweeper>(options_.sweep_interval, [this] { SweepOnce(); });
    sweeper_->Start();
  }

  LEDGER_LOG_INFO("Allocation ledger started", {UintField("budget_bytes", options_.max_budget_bytes),
                                                UintField("sweep_interval_ms", util::ToMillis(options_.sweep_interval))});
}

AllocationLedger::~AllocationLedger() {
  {
    std::lock_guard lock(mutex_);
    if (terminated_) return;
  }

  // Subscribers may already be gone; only an explicit Destroy() notifies.
  bus_.Clear();

  // Last owner released from a sweep handler: the sweeper detaches itself.
  if (sweeper_ && sweeper_->OnWorkerThread()) {
    std::lock_guard lock(mutex_);
    ResetTotalsLocked();
    return;
  }

  try {
    Destroy();
  } catch (const std::exception& e) {
    LEDGER_LOG_WARN("Ledger teardown failed", {StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Allocate
// ------------------------------------------------------------

void AllocationLedger::AllocateHandle(const std::string& id, std::uint64_t size_bytes, std::shared_ptr<model::LivenessHandle> handle,
                                      std::uint32_t priority_tier) {
  EventList pending;
  std::exception_ptr failure;
  {
    std::lock_guard lock(mutex_);
    ThrowIfTerminatedLocked("allocate");
    try {
      AllocateLocked(id, size_bytes, std::move(handle), priority_tier, pending);
    } catch (const util::InsufficientBudget&) {
      failure = std::current_exception();
    }
  }

  // Evictions performed before a failure stand and are reported.
  bus_.Publish(pending);
  if (failure) std::rethrow_exception(failure);
}

void AllocationLedger::AllocateLocked(const std::string& id, std::uint64_t size_bytes, std::shared_ptr<model::LivenessHandle> handle,
                                      std::uint32_t priority_tier, EventList& pending) {
  if (id.empty()) {
    throw util::InvalidArgument("allocation id must not be empty");
  }
  if (size_bytes == 0) {
    throw util::InvalidArgument("allocation '" + id + "' must have a positive size");
  }
  if (!handle) {
    throw util::InvalidArgument("allocation '" + id + "' has no payload handle");
  }

  const auto now = clock_->Now();

  auto replaced_size = [&]() -> std::uint64_t {
    auto it = records_.find(id);
    return it == records_.end() ? 0 : it->second.size_bytes;
  };

  try {
    if (Exceeds(total_allocated_ - replaced_size(), size_bytes, options_.max_budget_bytes)) {
      FreeUpSpaceLocked(size_bytes, now, id, pending);
    }

    if (Exceeds(total_allocated_ - replaced_size(), size_bytes, options_.max_budget_bytes)) {
      throw util::InsufficientBudget("allocation '" + id + "' of " + std::to_string(size_bytes) + " bytes exceeds the remaining budget");
    }
  } catch (const util::InsufficientBudget& e) {
    pending.push_back(events::LedgerEvent::AllocationFailed(id, size_bytes));
    observability::Metrics::Instance().RecordAllocation(false);
    LEDGER_LOG_WARN("Allocation rejected", {StringField("id", id), UintField("size_bytes", size_bytes), StringField("reason", e.what())});
    throw;
  }

  if (auto it = records_.find(id); it != records_.end()) {
    const auto old_size = it->second.size_bytes;
    const bool was_live = it->second.payload && it->second.payload->Alive();
    EraseLocked(it);
    if (was_live) {
      pending.push_back(events::LedgerEvent::Released(id, old_size));
    }
  }

  model::AllocationRecord record;
  record.id               = id;
  record.size_bytes       = size_bytes;
  record.used_bytes       = size_bytes;
  record.last_accessed_at = now;
  record.priority_tier    = priority_tier;
  record.payload          = std::move(handle);
  InsertLocked(std::move(record));

  pending.push_back(events::LedgerEvent::Allocated(id, size_bytes));
  observability::Metrics::Instance().RecordAllocation(true);
  LEDGER_LOG_DEBUG("Allocated", {StringField("id", id), UintField("size_bytes", size_bytes), UintField("tier", priority_tier)});
}

// ------------------------------------------------------------
// Eviction
// ------------------------------------------------------------

void AllocationLedger::FreeUpSpaceLocked(std::uint64_t required_bytes, util::TimePoint now, const std::string& exclude_id, EventList& pending) {
  std::uint64_t freed = 0;

  for (const auto* candidate : policy_.Order(records_)) {
    if (freed >= required_bytes) break;
    if (candidate->id == exclude_id) continue;

    const auto verdict = policy_.Judge(*candidate, now);
    if (verdict == EvictionPolicy::Verdict::kKeep) continue;

    const std::string id   = candidate->id;
    const auto        size = candidate->size_bytes;
    EraseLocked(records_.find(id));
    freed += size;

    if (verdict == EvictionPolicy::Verdict::kIdle) {
      pending.push_back(events::LedgerEvent::Freed(id, size));
      observability::Metrics::Instance().RecordEviction("idle", size);
      LEDGER_LOG_DEBUG("Evicted idle record", {StringField("id", id), UintField("size_bytes", size)});
    } else {
      observability::Metrics::Instance().RecordEviction("dead", size);
    }
  }

  if (freed < required_bytes) {
    throw util::InsufficientBudget("could not free " + std::to_string(required_bytes) + " bytes, freed " + std::to_string(freed));
  }
}

// ------------------------------------------------------------
// Access / Release / ReportUsage
// ------------------------------------------------------------

std::shared_ptr<const void> AllocationLedger::Access(const std::string& id) {
  return AccessImpl(id, std::nullopt);
}

std::shared_ptr<const void> AllocationLedger::AccessImpl(const std::string& id, std::optional<std::type_index> expected) {
  std::lock_guard lock(mutex_);
  ThrowIfTerminatedLocked("access");

  auto it = records_.find(id);
  if (it == records_.end()) {
    throw util::NotFound("allocation '" + id + "' not found");
  }

  auto payload = it->second.payload ? it->second.payload->TryResolve() : nullptr;
  if (!payload) {
    const auto size = it->second.size_bytes;
    EraseLocked(it);
    observability::Metrics::Instance().RecordEviction("dead", size);
    throw util::Reclaimed("payload of allocation '" + id + "' has been destroyed");
  }

  if (expected && *expected != it->second.payload->Type()) {
    throw util::TypeMismatch("allocation '" + id + "' holds " + it->second.payload->Type().name() + ", not " + expected->name());
  }

  it->second.last_accessed_at = clock_->Now();
  return payload;
}

void AllocationLedger::Release(const std::string& id) {
  EventList pending;
  {
    std::lock_guard lock(mutex_);
    ThrowIfTerminatedLocked("release");

    auto it = records_.find(id);
    if (it == records_.end()) {
      throw util::NotFound("allocation '" + id + "' not found");
    }

    const auto size = it->second.size_bytes;
    EraseLocked(it);
    pending.push_back(events::LedgerEvent::Released(id, size));
    observability::Metrics::Instance().RecordEviction("released", size);
  }

  bus_.Publish(pending);
}

void AllocationLedger::ReportUsage(const std::string& id, std::uint64_t used_bytes) {
  std::lock_guard lock(mutex_);
  ThrowIfTerminatedLocked("report usage");

  auto it = records_.find(id);
  if (it == records_.end()) {
    throw util::NotFound("allocation '" + id + "' not found");
  }

  if (!it->second.payload || !it->second.payload->Alive()) {
    const auto size = it->second.size_bytes;
    EraseLocked(it);
    observability::Metrics::Instance().RecordEviction("dead", size);
    throw util::Reclaimed("payload of allocation '" + id + "' has been destroyed");
  }

  if (used_bytes > it->second.size_bytes) {
    throw util::InvalidArgument("allocation '" + id + "' cannot use " + std::to_string(used_bytes) + " of " +
                                std::to_string(it->second.size_bytes) + " bytes");
  }

  const auto delta = static_cast<std::int64_t>(used_bytes) - static_cast<std::int64_t>(it->second.used_bytes);
  total_used_            = total_used_ - it->second.used_bytes + used_bytes;
  it->second.used_bytes = used_bytes;
  observability::Metrics::Instance().AdjustLedgerBytes(0, delta);
}

// ------------------------------------------------------------
// Telemetry
// ------------------------------------------------------------

model::LedgerStats AllocationLedger::GetStats() const {
  std::lock_guard lock(mutex_);
  ThrowIfTerminatedLocked("stats");
  return StatsLocked();
}

model::LedgerStats AllocationLedger::StatsLocked() const {
  model::LedgerStats stats;
  stats.total_allocated     = total_allocated_;
  stats.total_used          = total_used_;
  stats.block_count         = records_.size();
  stats.fragmentation_ratio = total_allocated_ == 0 ? 0.0 : 1.0 - static_cast<double>(total_used_) / static_cast<double>(total_allocated_);
  stats.average_utilization = static_cast<double>(total_used_) / static_cast<double>(options_.max_budget_bytes);
  return stats;
}

bool AllocationLedger::Contains(const std::string& id) const {
  std::lock_guard lock(mutex_);
  ThrowIfTerminatedLocked("lookup");
  return records_.count(id) > 0;
}

std::optional<model::AllocationRecord> AllocationLedger::Find(const std::string& id) const {
  std::lock_guard lock(mutex_);
  ThrowIfTerminatedLocked("lookup");

  auto it = records_.find(id);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------
// Liveness sweep
// ------------------------------------------------------------

std::uint64_t AllocationLedger::SweepLocked(EventList& pending) {
  std::uint64_t freed = 0;

  for (auto it = records_.begin(); it != records_.end();) {
    if (it->second.payload && it->second.payload->Alive()) {
      ++it;
      continue;
    }

    freed += it->second.size_bytes;
    auto next = std::next(it);
    EraseLocked(it);
    it = next;
  }

  if (freed > 0) {
    pending.push_back(events::LedgerEvent::SweepComplete(freed));
    observability::Metrics::Instance().RecordEviction("dead", freed);
  }
  return freed;
}

std::uint64_t AllocationLedger::SweepNow() {
  EventList pending;
  std::uint64_t freed = 0;
  {
    std::lock_guard lock(mutex_);
    ThrowIfTerminatedLocked("sweep");
    freed = SweepLocked(pending);
  }

  bus_.Publish(pending);
  return freed;
}

void AllocationLedger::SweepOnce() {
  EventList pending;
  {
    std::lock_guard lock(mutex_);
    if (terminated_) return;

    const auto    started = util::SteadyClock::now();
    std::uint64_t freed   = SweepLocked(pending);
    observability::Metrics::Instance().ObserveSweepDurationMs(util::ElapsedMillis(started, util::SteadyClock::now()));
    if (freed > 0) {
      LEDGER_LOG_DEBUG("Liveness sweep reclaimed bytes", {UintField("freed_bytes", freed), UintField("blocks", records_.size())});
    }
  }

  // Handlers may tear the ledger down; nothing may touch members past this point.
  bus_.Publish(pending);
}

// ------------------------------------------------------------
// Compaction
// ------------------------------------------------------------

bool AllocationLedger::Defragment() {
  EventList pending;
  {
    std::lock_guard lock(mutex_);
    ThrowIfTerminatedLocked("defragment");

    const auto before = StatsLocked();
    if (before.fragmentation_ratio < options_.defragment_threshold) {
      LEDGER_LOG_DEBUG("Defragment skipped", {DoubleField("fragmentation_ratio", before.fragmentation_ratio)});
      return false;
    }

    const auto started = util::SteadyClock::now();

    std::vector<model::AllocationRecord> live;
    live.reserve(records_.size());
    for (const auto& [id, record] : records_) {
      if (record.payload && record.payload->Alive()) live.push_back(record);
    }

    std::sort(live.begin(), live.end(), [](const model::AllocationRecord& a, const model::AllocationRecord& b) {
      return std::tie(b.priority_tier, b.last_accessed_at, a.id) < std::tie(a.priority_tier, a.last_accessed_at, b.id);
    });

    std::size_t dropped_dead = records_.size() - live.size();
    ResetTotalsLocked();

    std::size_t dropped_budget = 0;
    for (auto& record : live) {
      if (!record.payload->Alive()) {
        ++dropped_dead;
        continue;
      }
      try {
        AllocateLocked(record.id, record.size_bytes, record.payload, record.priority_tier, pending);
      } catch (const util::InsufficientBudget&) {
        ++dropped_budget;
      }
    }

    const auto after = StatsLocked();
    pending.push_back(events::LedgerEvent::DefragmentComplete(after));
    observability::Metrics::Instance().ObserveDefragmentDurationMs(util::ElapsedMillis(started, util::SteadyClock::now()));

    LEDGER_LOG_INFO("Defragment complete", {DoubleField("fragmentation_before", before.fragmentation_ratio),
                                            DoubleField("fragmentation_after", after.fragmentation_ratio), UintField("blocks", after.block_count),
                                            UintField("dropped_dead", dropped_dead), UintField("dropped_budget", dropped_budget)});
  }

  bus_.Publish(pending);
  return true;
}

// ------------------------------------------------------------
// Teardown
// ------------------------------------------------------------

void AllocationLedger::Destroy() {
  if (sweeper_ && sweeper_->OnWorkerThread()) {
    throw util::InvalidState("ledger cannot be destroyed from a sweep event handler");
  }

  std::lock_guard lifecycle(lifecycle_mutex_);
  {
    std::lock_guard lock(mutex_);
    ThrowIfTerminatedLocked("destroy");
  }

  // an in-flight sweep finishes before Stop() returns
  if (sweeper_) sweeper_->Stop();

  std::size_t dropped = 0;
  {
    std::lock_guard lock(mutex_);
    dropped = records_.size();
    ResetTotalsLocked();
    terminated_ = true;
  }

  bus_.Publish(events::LedgerEvent::Destroyed());
  bus_.Clear();

  LEDGER_LOG_INFO("Allocation ledger destroyed", {UintField("dropped_blocks", dropped)});
}

bool AllocationLedger::Terminated() const {
  std::lock_guard lock(mutex_);
  return terminated_;
}

// ------------------------------------------------------------
// Events
// ------------------------------------------------------------

events::EventBus::SubscriptionId AllocationLedger::Subscribe(events::EventBus::Handler handler) {
  {
    std::lock_guard lock(mutex_);
    ThrowIfTerminatedLocked("subscribe");
  }
  return bus_.Subscribe(std::move(handler));
}

bool AllocationLedger::Unsubscribe(events::EventBus::SubscriptionId id) {
  return bus_.Unsubscribe(id);
}

// ------------------------------------------------------------
// Bookkeeping
// ------------------------------------------------------------

void AllocationLedger::ThrowIfTerminatedLocked(std::string_view op) const {
  if (terminated_) {
    throw util::LedgerTerminated("ledger was destroyed; cannot " + std::string(op));
  }
}

void AllocationLedger::InsertLocked(model::AllocationRecord record) {
  total_allocated_ += record.size_bytes;
  total_used_ += record.used_bytes;
  observability::Metrics::Instance().AdjustLedgerBytes(static_cast<std::int64_t>(record.size_bytes), static_cast<std::int64_t>(record.used_bytes));
  auto key        = record.id;
  records_[key] = std::move(record);
}

void AllocationLedger::EraseLocked(RecordMap::iterator it) {
  total_allocated_ -= it->second.size_bytes;
  total_used_ -= it->second.used_bytes;
  observability::Metrics::Instance().AdjustLedgerBytes(-static_cast<std::int64_t>(it->second.size_bytes),
                                                       -static_cast<std::int64_t>(it->second.used_bytes));
  records_.erase(it);
}

void AllocationLedger::ResetTotalsLocked() {
  observability::Metrics::Instance().AdjustLedgerBytes(-static_cast<std::int64_t>(total_allocated_), -static_cast<std::int64_t>(total_used_));
  records_.clear();
  total_allocated_ = 0;
  total_used_      = 0;
}

} // namespace ledger::core
