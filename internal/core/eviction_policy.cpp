#include "eviction_policy.hpp"

#include <algorithm>
#include <tuple>

namespace ledger::core {

EvictionPolicy::EvictionPolicy() : EvictionPolicy(Options{}) {
}

EvictionPolicy::EvictionPolicy(Options options) : options_(options) {
}

std::vector<const model::AllocationRecord*> EvictionPolicy::Order(const RecordMap& records) const {
  std::vector<const model::AllocationRecord*> ordered;
  ordered.reserve(records.size());
  for (const auto& [id, record] : records) ordered.push_back(&record);

  std::sort(ordered.begin(), ordered.end(), [](const model::AllocationRecord* a, const model::AllocationRecord* b) {
    return std::tie(a->priority_tier, a->last_accessed_at, a->id) < std::tie(b->priority_tier, b->last_accessed_at, b->id);
  });
  return ordered;
}

EvictionPolicy::Verdict EvictionPolicy::Judge(const model::AllocationRecord& record, util::TimePoint now) const {
  if (!record.payload || !record.payload->Alive()) {
    return Verdict::kDead;
  }

  if (!IsProtected(record.priority_tier) && now - record.last_accessed_at > options_.idle_threshold) {
    return Verdict::kIdle;
  }

  return Verdict::kKeep;
}

} // namespace ledger::core
