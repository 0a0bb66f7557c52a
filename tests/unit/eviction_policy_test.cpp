#include "internal/core/eviction_policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace {

using ledger::core::EvictionPolicy;
using ledger::model::AllocationRecord;
using ledger::util::Millis;
using ledger::util::TimePoint;

const TimePoint kNow = TimePoint{} + std::chrono::hours(10);

AllocationRecord MakeRecord(const std::string& id, std::uint32_t tier, Millis idle, const std::shared_ptr<int>& payload) {
  AllocationRecord record;
  record.id               = id;
  record.size_bytes       = 100;
  record.used_bytes       = 100;
  record.priority_tier    = tier;
  record.last_accessed_at = kNow - idle;
  record.payload          = ledger::model::MakeWeakHandle(payload);
  return record;
}

void TestOrderIsTierThenLeastRecentlyAccessed() {
  auto                      payload = std::make_shared<int>(1);
  EvictionPolicy::RecordMap records;
  records["t1-old"]   = MakeRecord("t1-old", 1, Millis(9000), payload);
  records["t0-new"]   = MakeRecord("t0-new", 0, Millis(10), payload);
  records["t2-old"]   = MakeRecord("t2-old", 2, Millis(99000), payload);
  records["t0-old"]   = MakeRecord("t0-old", 0, Millis(5000), payload);
  records["t1-fresh"] = MakeRecord("t1-fresh", 1, Millis(0), payload);

  EvictionPolicy policy;
  const auto     ordered = policy.Order(records);

  assert(ordered.size() == 5);
  assert(ordered[0]->id == "t0-old");
  assert(ordered[1]->id == "t0-new");
  assert(ordered[2]->id == "t1-old");
  assert(ordered[3]->id == "t1-fresh");
  assert(ordered[4]->id == "t2-old");
}

void TestOrderBreaksFullTiesById() {
  auto                      payload = std::make_shared<int>(1);
  EvictionPolicy::RecordMap records;
  records["b"] = MakeRecord("b", 1, Millis(100), payload);
  records["a"] = MakeRecord("a", 1, Millis(100), payload);
  records["c"] = MakeRecord("c", 1, Millis(100), payload);

  const auto ordered = EvictionPolicy().Order(records);
  assert(ordered[0]->id == "a");
  assert(ordered[1]->id == "b");
  assert(ordered[2]->id == "c");
}

void TestJudgeIdleOnlyBelowProtectedTier() {
  auto           payload = std::make_shared<int>(1);
  EvictionPolicy policy;

  assert(policy.Judge(MakeRecord("idle-low", 1, Millis(300001), payload), kNow) == EvictionPolicy::Verdict::kIdle);
  assert(policy.Judge(MakeRecord("idle-zero", 0, Millis(600000), payload), kNow) == EvictionPolicy::Verdict::kIdle);
  assert(policy.Judge(MakeRecord("idle-protected", 2, Millis(900000), payload), kNow) == EvictionPolicy::Verdict::kKeep);
  assert(policy.Judge(MakeRecord("fresh-low", 0, Millis(1000), payload), kNow) == EvictionPolicy::Verdict::kKeep);
  // strictly greater than the threshold
  assert(policy.Judge(MakeRecord("boundary", 0, Millis(300000), payload), kNow) == EvictionPolicy::Verdict::kKeep);
}

void TestJudgeDeadRegardlessOfTier() {
  auto record = MakeRecord("gone", 5, Millis(0), std::make_shared<int>(7));

  EvictionPolicy policy;
  assert(policy.Judge(record, kNow) == EvictionPolicy::Verdict::kDead);
}

void TestCustomOptions() {
  EvictionPolicy::Options options;
  options.idle_threshold = Millis(50);
  options.protected_tier = 4;
  EvictionPolicy policy(options);

  auto payload = std::make_shared<int>(1);
  assert(policy.Judge(MakeRecord("tier3", 3, Millis(51), payload), kNow) == EvictionPolicy::Verdict::kIdle);
  assert(policy.Judge(MakeRecord("tier4", 4, Millis(51), payload), kNow) == EvictionPolicy::Verdict::kKeep);
  assert(policy.IsProtected(4));
  assert(!policy.IsProtected(3));
}

} // namespace

int main() {
  TestOrderIsTierThenLeastRecentlyAccessed();
  TestOrderBreaksFullTiesById();
  TestJudgeIdleOnlyBelowProtectedTier();
  TestJudgeDeadRegardlessOfTier();
  TestCustomOptions();

  std::cout << "ledger_unit_eviction_policy: pass\n";
  return 0;
}
