#pragma once

#include <memory>
#include <typeindex>
#include <typeinfo>

namespace ledger::model {

/*
  Non-owning view of a tracked payload.

  The ledger never extends a payload's lifetime: once the owner releases its
  last strong reference, TryResolve() returns nullptr from then on.
*/
class LivenessHandle {
 public:
  virtual ~LivenessHandle() = default;

  virtual std::shared_ptr<const void> TryResolve() const = 0;

  virtual std::type_index Type() const = 0;

  bool Alive() const {
    return TryResolve() != nullptr;
  }
};

class WeakPayloadHandle final : public LivenessHandle {
 public:
  WeakPayloadHandle(std::weak_ptr<const void> ref, std::type_index type) : ref_(std::move(ref)), type_(type) {
  }

  std::shared_ptr<const void> TryResolve() const override {
    return ref_.lock();
  }

  std::type_index Type() const override {
    return type_;
  }

 private:
  std::weak_ptr<const void> ref_;
  std::type_index           type_;
};

template <typename T>
std::shared_ptr<LivenessHandle> MakeWeakHandle(const std::shared_ptr<T>& payload) {
  std::shared_ptr<const void> erased = payload;
  return std::make_shared<WeakPayloadHandle>(std::weak_ptr<const void>(erased), std::type_index(typeid(T)));
}

} // namespace ledger::model
