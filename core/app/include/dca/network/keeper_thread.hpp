#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace dca {

// -----------------------------------------------------------------------------
// KeeperThread — periodic trigger for the automation agent
// -----------------------------------------------------------------------------
//
// @brief  Calls a poll callback every `interval` on a dedicated thread.
//
// @details
// The callback is bound to DcaEngine::executeDue(agent) by the engine. It
// returns how many orders it executed; the keeper only counts them.
//
// Between polls the worker sleeps on a condition variable with wait_for(),
// so stop() wakes it immediately instead of waiting out the interval.
//
// The callback must not throw. DcaEngine::executeDue() already turns every
// per-order OrderError into a log line and an ExecutionRejectedEvent; an
// exception reaching the keeper is logged to stderr and the loop carries on
// with the next poll.
//
// Thread model:
//   start()/stop() from the owning thread (DcaEngine::start/stop).
//   The callback runs on the keeper thread only.
// -----------------------------------------------------------------------------
class KeeperThread {
 public:
  using PollCallback = std::function<std::size_t()>;

  KeeperThread(PollCallback poll, std::chrono::milliseconds interval);

  ~KeeperThread();

  KeeperThread(const KeeperThread&) = delete;
  KeeperThread& operator=(const KeeperThread&) = delete;
  KeeperThread(KeeperThread&&) = delete;
  KeeperThread& operator=(KeeperThread&&) = delete;

  // Idempotent.
  void start();

  // Wakes the worker and joins it. Idempotent.
  void stop();

  std::uint64_t pollCount() const { return poll_count_.load(); }
  std::uint64_t executedCount() const { return executed_count_.load(); }

 private:
  void run();

  PollCallback poll_;
  std::chrono::milliseconds interval_;

  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;

  std::atomic<std::uint64_t> poll_count_{0};
  std::atomic<std::uint64_t> executed_count_{0};
};

}  // namespace dca
