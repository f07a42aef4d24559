#include "dca/network/keeper_thread.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace dca {

KeeperThread::KeeperThread(PollCallback poll,
                           std::chrono::milliseconds interval)
    : poll_(std::move(poll)), interval_(interval) {}

KeeperThread::~KeeperThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void KeeperThread::start() {
  if (thread_.joinable()) {
    return;
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[KeeperThread] started. interval=" << interval_.count()
            << "ms\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void KeeperThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  {
    // Flip under the mutex so the worker cannot miss the notify between
    // its predicate check and going to sleep.
    std::lock_guard lock(stop_mutex_);
    running_.store(false);
  }
  stop_cv_.notify_all();
  thread_.join();

  std::cout << "[KeeperThread] stopped. polls=" << poll_count_.load()
            << " executed=" << executed_count_.load() << "\n";
}

// -----------------------------------------------------------------------------
// run() — poll, then sleep until the next interval or stop()
// -----------------------------------------------------------------------------
void KeeperThread::run() {
  while (running_.load()) {
    try {
      executed_count_.fetch_add(poll_());
    } catch (const std::exception& e) {
      std::cerr << "[KeeperThread] poll failed: " << e.what() << "\n";
    }
    poll_count_.fetch_add(1);

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
  }
}

}  // namespace dca
