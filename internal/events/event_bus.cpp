#include "event_bus.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include "internal/observability/logging.hpp"

namespace ledger::events {

EventBus::SubscriptionId EventBus::Subscribe(Handler handler) {
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  entries_.push_back({id, std::make_shared<Handler>(std::move(handler))});
  return id;
}

bool EventBus::Unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(entries_.begin(), entries_.end(), [id](const Entry& e) { return e.id == id; });
  if (it == entries_.end()) return false;

  entries_.erase(it);
  return true;
}

void EventBus::Publish(const LedgerEvent& event) const {
  std::vector<std::shared_ptr<Handler>> handlers;
  {
    std::lock_guard lock(mutex_);
    handlers.reserve(entries_.size());
    for (const auto& entry : entries_) handlers.push_back(entry.handler);
  }

  for (const auto& handler : handlers) {
    try {
      (*handler)(event);
    } catch (const std::exception& e) {
      LEDGER_LOG_WARN("Event handler failed", {observability::StringField("event", ToString(event.type)),
                                               observability::StringField("error", e.what())});
    }
  }
}

void EventBus::Publish(const std::vector<LedgerEvent>& events) const {
  for (const auto& event : events) Publish(event);
}

void EventBus::Clear() {
  std::lock_guard lock(mutex_);
  entries_.clear();
}

std::size_t EventBus::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

} // namespace ledger::events
