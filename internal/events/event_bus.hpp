#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "ledger_event.hpp"

namespace ledger::events {

/*
  Subscriber registry scoped to one ledger instance.

  Publish() snapshots the handler list and invokes it without holding the
  registry lock, so handlers may subscribe, unsubscribe or call back into the
  ledger. A handler that throws is logged and does not stop delivery to the
  remaining handlers.
*/
class EventBus {
 public:
  using Handler        = std::function<void(const LedgerEvent&)>;
  using SubscriptionId = std::uint64_t;

  SubscriptionId Subscribe(Handler handler);

  // Returns false if the id was not registered.
  bool Unsubscribe(SubscriptionId id);

  void Publish(const LedgerEvent& event) const;
  void Publish(const std::vector<LedgerEvent>& events) const;

  void Clear();

  std::size_t SubscriberCount() const;

 private:
  struct Entry {
    SubscriptionId           id;
    std::shared_ptr<Handler> handler;
  };

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
  SubscriptionId     next_id_ = 1;
};

} // namespace ledger::events
