#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>

#include <exec/async_scope.hpp>
#include <exec/timed_thread_scheduler.hpp>

#include "engine/script_registry.hpp"

namespace srunner::runtime {

struct SweepStats {
  std::size_t records = 0;
  std::size_t handles = 0;
};

/// Periodically evicts terminal records and orphaned cancellation handles.
///
/// Runs are chained on a timer thread, so two sweeps never overlap; run_once()
/// takes the same lock when called directly.
class CleanupSweeper {
 public:
  /// The first sweep runs after `first_delay`, then once per `interval`.
  CleanupSweeper(engine::ScriptRegistry& registry, std::chrono::milliseconds interval,
                 std::chrono::milliseconds first_delay = std::chrono::milliseconds::zero());
  /// Cancels the pending timer and waits for a sweep in progress.
  ~CleanupSweeper();

  CleanupSweeper(const CleanupSweeper&) = delete;
  auto operator=(const CleanupSweeper&) -> CleanupSweeper& = delete;

  auto run_once() -> SweepStats;
  auto runs() const -> std::size_t { return runs_.load(std::memory_order_acquire); }

 private:
  auto schedule_sweep(std::chrono::milliseconds delay) -> void;

  engine::ScriptRegistry& registry_;
  std::chrono::milliseconds interval_;
  std::unique_ptr<exec::timed_thread_context> scheduler_context_;
  exec::timed_thread_scheduler scheduler_;
  std::atomic<bool> running_{true};
  std::atomic<std::size_t> runs_{0};
  std::mutex sweep_mutex_;
  exec::async_scope scope_;
};

}  // namespace srunner::runtime
