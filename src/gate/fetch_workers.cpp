#include <sentinel/gate/fetch_workers.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace sentinel::gate {

fetch_workers::fetch_workers(const std::size_t capacity)
    : capacity_{std::max<std::size_t>(capacity, 1)} {}

fetch_workers::~fetch_workers() {
  auto workers = std::list<worker>{};
  {
    auto lock = std::scoped_lock{mutex_};
    workers.swap(workers_);
  }
  if (!workers.empty()) {
    spdlog::debug("Joining {} policy fetch worker(s)", workers.size());
  }
  for (auto& w : workers) {
    w.thread.join();
  }
}

bool fetch_workers::spawn(std::function<void()> task) {
  auto lock = std::scoped_lock{mutex_};
  reap_locked();
  if (workers_.size() >= capacity_) {
    spdlog::warn("All {} policy fetch workers are busy", capacity_);
    return false;
  }
  auto done = std::make_shared<std::atomic<bool>>(false);
  workers_.push_back(worker{
      .thread = std::thread{[task = std::move(task), done]() {
        task();
        done->store(true);
      }},
      .done = done});
  return true;
}

std::size_t fetch_workers::running() const {
  auto lock = std::scoped_lock{mutex_};
  return static_cast<std::size_t>(
      std::ranges::count_if(workers_, [](const worker& w) {
        return !w.done->load();
      }));
}

void fetch_workers::reap_locked() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace sentinel::gate
