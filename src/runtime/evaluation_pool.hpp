#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <unordered_set>

#include <exec/async_scope.hpp>
#include <exec/static_thread_pool.hpp>

#include "engine/cancellation.hpp"
#include "engine/error.hpp"

namespace srunner::runtime {

/// Cancellable handle to one evaluation submitted to the EvaluationPool.
///
/// The handle is done as soon as the evaluation returned or was cancelled; a
/// cancelled evaluation may still be unwinding on its worker thread.
class EvaluationHandle final : public engine::CancellationHandle {
 public:
  EvaluationHandle() = default;
  EvaluationHandle(const EvaluationHandle&) = delete;
  auto operator=(const EvaluationHandle&) -> EvaluationHandle& = delete;

  auto cancel() -> bool override;
  auto done() const -> bool override;
  auto cancelled() const -> bool override;

  /// Wait up to `timeout` for the handle to become done.
  auto wait_for(std::chrono::milliseconds timeout) const -> bool;
  auto wait() const -> void;

  /// Outcome of the evaluation; Interrupted once cancelled. Blocks until done.
  auto result() const -> engine::Expected<void>;

 private:
  friend class EvaluationPool;

  enum class State { Pending, Running, Completed, Cancelled };

  auto try_start() -> bool;
  auto finish(engine::Expected<void> result) -> void;
  auto stop_token() const -> std::stop_token { return stop_source_.get_token(); }

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  State state_ = State::Pending;
  engine::Expected<void> result_;
  std::stop_source stop_source_;
};

/// Fixed-capacity pool that runs sandbox evaluations.
///
/// Work beyond capacity waits in the pool's queue. An evaluation cancelled
/// while still queued never runs.
class EvaluationPool {
 public:
  using Task = std::function<engine::Expected<void>(std::stop_token)>;

  explicit EvaluationPool(std::size_t capacity);
  /// Cancels nothing by itself; waits until every spawned task returned.
  ~EvaluationPool();

  EvaluationPool(const EvaluationPool&) = delete;
  auto operator=(const EvaluationPool&) -> EvaluationPool& = delete;

  /// Queue `task` for `handle`. `on_start` runs on the worker right before the
  /// task, and only if the handle was not cancelled while queued.
  auto submit(const std::shared_ptr<EvaluationHandle>& handle, Task task,
              std::function<void()> on_start = {}) -> void;

  /// Cancel every live evaluation and refuse new ones.
  auto shutdown() -> void;

  auto capacity() const -> std::size_t { return capacity_; }
  auto in_flight() const -> std::size_t;

 private:
  auto run(const std::shared_ptr<EvaluationHandle>& handle, const Task& task,
           const std::function<void()>& on_start) noexcept -> void;
  auto forget(const std::shared_ptr<EvaluationHandle>& handle) -> void;

  std::size_t capacity_;
  exec::static_thread_pool pool_;
  exec::async_scope scope_;
  mutable std::mutex mutex_;
  std::unordered_set<std::shared_ptr<EvaluationHandle>> live_;
  bool stopping_ = false;
};

}  // namespace srunner::runtime
