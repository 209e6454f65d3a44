#include "runtime/evaluation_pool.hpp"

#include <cstdint>
#include <exception>
#include <utility>
#include <vector>

#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

namespace srunner::runtime {

auto EvaluationHandle::cancel() -> bool {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Completed || state_ == State::Cancelled) {
      return false;
    }
    state_ = State::Cancelled;
    result_ = tl::unexpected(
      engine::make_error(engine::ErrorCode::Interrupted, "script execution interrupted"));
  }
  cv_.notify_all();
  stop_source_.request_stop();
  return true;
}

auto EvaluationHandle::done() const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == State::Completed || state_ == State::Cancelled;
}

auto EvaluationHandle::cancelled() const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == State::Cancelled;
}

auto EvaluationHandle::wait_for(std::chrono::milliseconds timeout) const -> bool {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] {
    return state_ == State::Completed || state_ == State::Cancelled;
  });
}

auto EvaluationHandle::wait() const -> void {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return state_ == State::Completed || state_ == State::Cancelled; });
}

auto EvaluationHandle::result() const -> engine::Expected<void> {
  wait();
  std::lock_guard<std::mutex> lock(mutex_);
  return result_;
}

auto EvaluationHandle::try_start() -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != State::Pending) {
    return false;
  }
  state_ = State::Running;
  return true;
}

auto EvaluationHandle::finish(engine::Expected<void> result) -> void {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::Running) {
      return;
    }
    state_ = State::Completed;
    result_ = std::move(result);
  }
  cv_.notify_all();
}

EvaluationPool::EvaluationPool(std::size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1),
      pool_(static_cast<std::uint32_t>(capacity_)) {
  srunner::log::info("Evaluation pool started with {} workers", capacity_);
}

EvaluationPool::~EvaluationPool() {
  stdexec::sync_wait(scope_.on_empty());
}

auto EvaluationPool::submit(const std::shared_ptr<EvaluationHandle>& handle, Task task,
                            std::function<void()> on_start) -> void {
  bool accepted = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stopping_) {
      live_.insert(handle);
      accepted = true;
    }
  }
  if (!accepted) {
    handle->cancel();
    return;
  }

  auto sender = stdexec::schedule(pool_.get_scheduler()) |
                stdexec::then([this, handle, task = std::move(task),
                               on_start = std::move(on_start)]() noexcept {
                  run(handle, task, on_start);
                });
  scope_.spawn(std::move(sender));
}

auto EvaluationPool::shutdown() -> void {
  std::vector<std::shared_ptr<EvaluationHandle>> handles;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    handles.assign(live_.begin(), live_.end());
  }
  for (const auto& handle : handles) {
    handle->cancel();
  }
  if (!handles.empty()) {
    srunner::log::info("Evaluation pool cancelled {} evaluations", handles.size());
  }
}

auto EvaluationPool::in_flight() const -> std::size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_.size();
}

auto EvaluationPool::run(const std::shared_ptr<EvaluationHandle>& handle, const Task& task,
                         const std::function<void()>& on_start) noexcept -> void {
  if (!handle->try_start()) {
    forget(handle);
    return;
  }
  engine::Expected<void> result;
  try {
    if (on_start) {
      on_start();
    }
    result = task(handle->stop_token());
  } catch (const std::exception& ex) {
    result = tl::unexpected(engine::make_error(engine::ErrorCode::EvaluationFailure, ex.what()));
  }
  handle->finish(std::move(result));
  forget(handle);
}

auto EvaluationPool::forget(const std::shared_ptr<EvaluationHandle>& handle) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  live_.erase(handle);
}

}  // namespace srunner::runtime
