#include "runtime/dispatch_pool.hpp"

#include <exception>
#include <format>
#include <system_error>
#include <utility>

#include "common/logging/log.hpp"

namespace srunner::runtime {

DispatchPool::DispatchPool(std::chrono::milliseconds keep_alive) : keep_alive_(keep_alive) {}

DispatchPool::~DispatchPool() {
  std::unordered_map<std::thread::id, std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    threads = std::move(threads_);
  }
  for (auto& [id, thread] : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

auto DispatchPool::submit(Job job) -> engine::Expected<void> {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopped_) {
    return tl::unexpected(engine::make_error(engine::ErrorCode::Internal, "dispatch pool stopped"));
  }
  reap_finished_locked();
  jobs_.push_back(std::move(job));
  if (idle_ >= jobs_.size()) {
    cv_.notify_one();
    return {};
  }
  try {
    std::thread worker([this] { worker_loop(); });
    auto id = worker.get_id();
    threads_.emplace(id, std::move(worker));
  } catch (const std::system_error& ex) {
    jobs_.pop_back();
    return tl::unexpected(engine::make_error(
      engine::ErrorCode::Internal, std::format("cannot start dispatch thread: {}", ex.what())));
  }
  return {};
}

auto DispatchPool::thread_count() const -> std::size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return threads_.size() - finished_.size();
}

auto DispatchPool::idle_count() const -> std::size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_;
}

auto DispatchPool::worker_loop() -> void {
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    if (jobs_.empty()) {
      if (stopped_) {
        break;
      }
      ++idle_;
      bool woken = cv_.wait_for(lock, keep_alive_, [this] { return stopped_ || !jobs_.empty(); });
      --idle_;
      if (!woken) {
        break;
      }
      continue;
    }
    auto job = std::move(jobs_.front());
    jobs_.pop_front();
    lock.unlock();
    try {
      job();
    } catch (const std::exception& ex) {
      srunner::log::error("dispatch job failed: {}", ex.what());
    }
    lock.lock();
  }
  if (!stopped_) {
    finished_.push_back(std::this_thread::get_id());
  }
}

auto DispatchPool::reap_finished_locked() -> void {
  for (auto id : finished_) {
    auto it = threads_.find(id);
    if (it == threads_.end()) {
      continue;
    }
    // The worker registered itself as finished as its last locked step.
    it->second.join();
    threads_.erase(it);
  }
  finished_.clear();
}

}  // namespace srunner::runtime
