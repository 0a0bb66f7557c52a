#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/model/liveness_handle.hpp"
#include "internal/util/time.hpp"

namespace ledger::model {

/*
  Accounting entry for one tracked object.

  size_bytes is the cost charged against the budget and never changes after
  creation. used_bytes starts equal to size_bytes and only moves when the
  owner reports its actual usage.
*/
struct AllocationRecord {
  std::string id;

  std::uint64_t size_bytes = 0;
  std::uint64_t used_bytes = 0;

  util::TimePoint last_accessed_at{};

  std::uint32_t priority_tier = 1;

  std::shared_ptr<LivenessHandle> payload;
};

struct LedgerStats {
  std::uint64_t total_allocated = 0;
  std::uint64_t total_used      = 0;
  std::size_t   block_count     = 0;

  double fragmentation_ratio = 0.0;
  double average_utilization = 0.0;

  bool operator==(const LedgerStats&) const = default;
};

} // namespace ledger::model
