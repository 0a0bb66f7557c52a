#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/allocation_record.hpp"

namespace ledger::events {

enum class EventType : std::uint8_t {
  kAllocated = 0,
  kFreed,
  kReleased,
  kAllocationFailed,
  kSweepComplete,
  kDefragmentComplete,
  kDestroyed,
};

constexpr std::string_view ToString(EventType type) {
  switch (type) {
    case EventType::kAllocated:
      return "allocated";
    case EventType::kFreed:
      return "freed";
    case EventType::kReleased:
      return "released";
    case EventType::kAllocationFailed:
      return "allocation_failed";
    case EventType::kSweepComplete:
      return "sweep_complete";
    case EventType::kDefragmentComplete:
      return "defragment_complete";
    case EventType::kDestroyed:
      return "destroyed";
    default:
      return "unknown";
  }
}

/*
  Notification published by the ledger.

  Field usage per type:
    kAllocated, kFreed, kReleased, kAllocationFailed -> id, size_bytes
    kSweepComplete                                   -> freed_bytes
    kDefragmentComplete                              -> stats
    kDestroyed                                       -> (none)
*/
struct LedgerEvent {
  EventType type = EventType::kAllocated;

  std::string   id;
  std::uint64_t size_bytes  = 0;
  std::uint64_t freed_bytes = 0;

  model::LedgerStats stats;

  static LedgerEvent Allocated(std::string id, std::uint64_t size_bytes) {
    return {EventType::kAllocated, std::move(id), size_bytes, 0, {}};
  }

  static LedgerEvent Freed(std::string id, std::uint64_t size_bytes) {
    return {EventType::kFreed, std::move(id), size_bytes, 0, {}};
  }

  static LedgerEvent Released(std::string id, std::uint64_t size_bytes) {
    return {EventType::kReleased, std::move(id), size_bytes, 0, {}};
  }

  static LedgerEvent AllocationFailed(std::string id, std::uint64_t size_bytes) {
    return {EventType::kAllocationFailed, std::move(id), size_bytes, 0, {}};
  }

  static LedgerEvent SweepComplete(std::uint64_t freed_bytes) {
    return {EventType::kSweepComplete, {}, 0, freed_bytes, {}};
  }

  static LedgerEvent DefragmentComplete(const model::LedgerStats& stats) {
    return {EventType::kDefragmentComplete, {}, 0, 0, stats};
  }

  static LedgerEvent Destroyed() {
    return {EventType::kDestroyed, {}, 0, 0, {}};
  }
};

} // namespace ledger::events
