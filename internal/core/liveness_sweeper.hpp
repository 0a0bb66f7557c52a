#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/util/time.hpp"

namespace ledger::core {

/*
  Background worker that runs the ledger's liveness sweep every interval.

  Stop() wakes the worker, waits for an in-flight pass to finish and joins.
  It throws InvalidState when called from the sweep callback itself. If the
  sweeper is destroyed on its own thread it requests stop and detaches; the
  loop state is shared with the thread so it outlives the object.
*/
class LivenessSweeper {
 public:
  using SweepFn = std::function<void()>;

  LivenessSweeper(util::Millis interval, SweepFn sweep);
  ~LivenessSweeper();

  LivenessSweeper(const LivenessSweeper&)            = delete;
  LivenessSweeper& operator=(const LivenessSweeper&) = delete;

  void Start();
  void Stop();

  bool Running() const {
    return running_;
  }

  bool OnWorkerThread() const;

 private:
  struct State {
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    stop_requested = false;
    util::Millis            interval;
    SweepFn                 sweep;
  };

  static void Loop(std::shared_ptr<State> state);

  void RequestStop();

  std::shared_ptr<State> state_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace ledger::core
