#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace sentinel::gate {

/// Owns the threads that run policy-source fetches.
///
/// A fetch that outlives its caller's deadline keeps running on its thread
/// until it returns; the thread is joined when it is reaped or when the group
/// is destroyed. At most `capacity` threads exist at once.
class fetch_workers final {
 public:
  explicit fetch_workers(const std::size_t capacity);
  ~fetch_workers();

  fetch_workers(const fetch_workers&) = delete;
  fetch_workers& operator=(const fetch_workers&) = delete;
  fetch_workers(fetch_workers&&) = delete;
  fetch_workers& operator=(fetch_workers&&) = delete;

  /// Starts `task` on a new thread. Returns false, without running it, when
  /// `capacity` threads are still busy.
  bool spawn(std::function<void()> task);

  std::size_t running() const;

 private:
  struct worker final {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void reap_locked();

  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::list<worker> workers_;
};

}  // namespace sentinel::gate
