#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "engine/error.hpp"

namespace srunner::runtime {

/// Unbounded pool for non-blocking submissions.
///
/// A job never waits for a free thread: when no worker is idle a new one is
/// started. Workers idle for longer than the keep-alive exit. Destruction runs
/// every queued job to completion, then joins the workers.
class DispatchPool {
 public:
  using Job = std::function<void()>;

  explicit DispatchPool(std::chrono::milliseconds keep_alive = std::chrono::seconds(60));
  ~DispatchPool();

  DispatchPool(const DispatchPool&) = delete;
  auto operator=(const DispatchPool&) -> DispatchPool& = delete;

  auto submit(Job job) -> engine::Expected<void>;

  auto thread_count() const -> std::size_t;
  auto idle_count() const -> std::size_t;

 private:
  auto worker_loop() -> void;
  auto reap_finished_locked() -> void;

  std::chrono::milliseconds keep_alive_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  std::unordered_map<std::thread::id, std::thread> threads_;
  std::vector<std::thread::id> finished_;
  std::size_t idle_ = 0;
  bool stopped_ = false;
};

}  // namespace srunner::runtime
