#include "liveness_sweeper.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::core {

LivenessSweeper::LivenessSweeper(util::Millis interval, SweepFn sweep) : state_(std::make_shared<State>()) {
  if (interval.count() <= 0) {
    throw util::InvalidArgument("sweep interval must be positive");
  }
  state_->interval = interval;
  state_->sweep    = std::move(sweep);
}

LivenessSweeper::~LivenessSweeper() {
  if (!thread_.joinable()) return;

  if (OnWorkerThread()) {
    RequestStop();
    thread_.detach();
    return;
  }

  RequestStop();
  thread_.join();
}

void LivenessSweeper::Start() {
  if (running_) return;

  {
    std::lock_guard lock(state_->mutex);
    state_->stop_requested = false;
  }
  running_ = true;
  thread_  = std::thread(&LivenessSweeper::Loop, state_);
}

void LivenessSweeper::Stop() {
  if (OnWorkerThread()) {
    throw util::InvalidState("liveness sweeper cannot be stopped from its own thread");
  }

  RequestStop();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

bool LivenessSweeper::OnWorkerThread() const {
  return thread_.joinable() && thread_.get_id() == std::this_thread::get_id();
}

void LivenessSweeper::RequestStop() {
  {
    std::lock_guard lock(state_->mutex);
    state_->stop_requested = true;
  }
  state_->cv.notify_all();
}

void LivenessSweeper::Loop(std::shared_ptr<State> state) {
  std::unique_lock lock(state->mutex);
  while (!state->stop_requested) {
    if (state->cv.wait_for(lock, state->interval, [&state] { return state->stop_requested; })) break;

    lock.unlock();
    try {
      state->sweep();
    } catch (const std::exception& e) {
      LEDGER_LOG_ERROR("Liveness sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace ledger::core
