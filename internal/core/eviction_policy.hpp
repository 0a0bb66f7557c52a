#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/allocation_record.hpp"
#include "internal/util/time.hpp"

namespace ledger::core {

/*
  Decides which records may leave the ledger under budget pressure.

  Pure: never mutates records, never reads a clock on its own.
*/
class EvictionPolicy {
 public:
  enum class Verdict {
    kKeep,
    kDead, // payload already destroyed by its owner
    kIdle, // low priority and idle past the threshold
  };

  struct Options {
    util::Millis  idle_threshold{300000};
    std::uint32_t protected_tier = 2;
  };

  using RecordMap = std::unordered_map<std::string, model::AllocationRecord>;

  EvictionPolicy();
  explicit EvictionPolicy(Options options);

  // Ascending (priority_tier, last_accessed_at, id): cheapest victim first.
  std::vector<const model::AllocationRecord*> Order(const RecordMap& records) const;

  Verdict Judge(const model::AllocationRecord& record, util::TimePoint now) const;

  bool IsProtected(std::uint32_t tier) const {
    return tier >= options_.protected_tier;
  }

  const Options& options() const {
    return options_;
  }

 private:
  Options options_;
};

} // namespace ledger::core
