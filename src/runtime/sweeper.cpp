#include "runtime/sweeper.hpp"

#include <string>

#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

namespace srunner::runtime {

CleanupSweeper::CleanupSweeper(engine::ScriptRegistry& registry, std::chrono::milliseconds interval,
                               std::chrono::milliseconds first_delay)
    : registry_(registry), interval_(interval),
      scheduler_context_(std::make_unique<exec::timed_thread_context>()),
      scheduler_(scheduler_context_->get_scheduler()), scope_() {
  srunner::log::info("Cleanup sweeper running every {} ms", interval_.count());
  schedule_sweep(first_delay);
}

CleanupSweeper::~CleanupSweeper() {
  running_ = false;
  scope_.request_stop();
  stdexec::sync_wait(scope_.on_empty());
}

auto CleanupSweeper::run_once() -> SweepStats {
  std::lock_guard<std::mutex> lock(sweep_mutex_);
  SweepStats stats;
  stats.records = registry_.evict_terminal();
  stats.handles = registry_.evict_orphan_handles();
  runs_.fetch_add(1, std::memory_order_acq_rel);
  if (stats.records != 0 || stats.handles != 0) {
    srunner::log::info("sweep_finished", {{"records", std::to_string(stats.records)},
                                          {"handles", std::to_string(stats.handles)}});
  }
  return stats;
}

auto CleanupSweeper::schedule_sweep(std::chrono::milliseconds delay) -> void {
  if (!running_.load(std::memory_order_relaxed)) {
    return;
  }
  auto sender = exec::schedule_after(scheduler_, delay) |
                stdexec::then([this] {
                  if (running_.load(std::memory_order_relaxed)) {
                    run_once();
                    schedule_sweep(interval_);
                  }
                });
  scope_.spawn(std::move(sender));
}

}  // namespace srunner::runtime
