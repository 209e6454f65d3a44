#include "test_support.hpp"

#include <stdexcept>

#include "runtime/dispatch_pool.hpp"
#include "runtime/evaluation_pool.hpp"

namespace {

using srunner::engine::ErrorCode;
using srunner::runtime::DispatchPool;
using srunner::runtime::EvaluationHandle;
using srunner::runtime::EvaluationPool;

constexpr auto kTimeout = std::chrono::milliseconds(5000);

auto test_dispatch_runs_jobs_without_waiting() -> bool {
  std::mutex mutex;
  std::condition_variable cv;
  int arrived = 0;
  bool release = false;
  constexpr int kJobs = 16;
  DispatchPool pool(std::chrono::seconds(5));
  for (int i = 0; i < kJobs; ++i) {
    auto submitted = pool.submit([&] {
      std::unique_lock<std::mutex> lock(mutex);
      ++arrived;
      cv.notify_all();
      cv.wait(lock, [&] { return release; });
    });
    if (!submitted) {
      return false;
    }
  }
  bool all_arrived = false;
  {
    std::unique_lock<std::mutex> lock(mutex);
    all_arrived = cv.wait_for(lock, kTimeout, [&] { return arrived == kJobs; });
    release = true;
  }
  cv.notify_all();
  return all_arrived && pool.thread_count() >= static_cast<std::size_t>(kJobs);
}

auto test_dispatch_reuses_idle_threads() -> bool {
  DispatchPool pool(std::chrono::seconds(5));
  std::atomic<int> ran{0};
  for (int i = 0; i < 5; ++i) {
    if (!pool.submit([&] { ran.fetch_add(1); })) {
      return false;
    }
    if (!wait_for_condition([&] { return ran.load() == i + 1 && pool.idle_count() == 1; }, kTimeout)) {
      return false;
    }
  }
  return pool.thread_count() == 1;
}

auto test_dispatch_idle_threads_expire() -> bool {
  DispatchPool pool(std::chrono::milliseconds(20));
  std::atomic<int> ran{0};
  if (!pool.submit([&] { ran.fetch_add(1); })) {
    return false;
  }
  if (!wait_for_condition([&] { return ran.load() == 1 && pool.thread_count() == 0; }, kTimeout)) {
    return false;
  }
  if (!pool.submit([&] { ran.fetch_add(1); })) {
    return false;
  }
  return wait_for_condition([&] { return ran.load() == 2; }, kTimeout);
}

auto test_dispatch_survives_throwing_job() -> bool {
  DispatchPool pool(std::chrono::seconds(5));
  std::atomic<bool> ran{false};
  if (!pool.submit([] { throw std::runtime_error("job failure"); })) {
    return false;
  }
  if (!pool.submit([&] { ran = true; })) {
    return false;
  }
  return wait_for_condition([&] { return ran.load(); }, kTimeout);
}

auto test_evaluation_pool_is_bounded() -> bool {
  constexpr std::size_t kCapacity = 3;
  EvaluationPool pool(kCapacity);
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::vector<std::shared_ptr<EvaluationHandle>> handles;
  for (int i = 0; i < 12; ++i) {
    auto handle = std::make_shared<EvaluationHandle>();
    handles.push_back(handle);
    pool.submit(handle, [&](std::stop_token) -> srunner::engine::Expected<void> {
      int now = running.fetch_add(1) + 1;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      running.fetch_sub(1);
      return {};
    });
  }
  for (const auto& handle : handles) {
    if (!handle->wait_for(kTimeout) || !handle->result()) {
      return false;
    }
  }
  return pool.capacity() == kCapacity && peak.load() <= static_cast<int>(kCapacity) &&
         peak.load() >= 1;
}

auto test_zero_capacity_clamped() -> bool {
  EvaluationPool pool(0);
  auto handle = std::make_shared<EvaluationHandle>();
  pool.submit(handle, [](std::stop_token) -> srunner::engine::Expected<void> { return {}; });
  return pool.capacity() == 1 && handle->wait_for(kTimeout) && handle->result().has_value();
}

auto test_cancelled_queued_task_never_runs() -> bool {
  EvaluationPool pool(1);
  std::atomic<bool> release{false};
  auto blocker = std::make_shared<EvaluationHandle>();
  pool.submit(blocker, [&](std::stop_token) -> srunner::engine::Expected<void> {
    while (!release.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return {};
  });

  std::atomic<bool> started{false};
  std::atomic<bool> ran{false};
  auto queued = std::make_shared<EvaluationHandle>();
  pool.submit(
    queued,
    [&](std::stop_token) -> srunner::engine::Expected<void> {
      ran = true;
      return {};
    },
    [&] { started = true; });

  if (!queued->cancel() || queued->cancel()) {
    return false;
  }
  release = true;
  blocker->wait();
  auto result = queued->result();
  return !result && result.error().code == ErrorCode::Interrupted &&
         wait_for_condition([&] { return pool.in_flight() == 0; }, kTimeout) && !ran.load() &&
         !started.load() && queued->cancelled();
}

auto test_cancel_requests_stop() -> bool {
  EvaluationPool pool(1);
  std::atomic<bool> entered{false};
  std::atomic<bool> saw_stop{false};
  auto handle = std::make_shared<EvaluationHandle>();
  pool.submit(handle, [&](std::stop_token stop) -> srunner::engine::Expected<void> {
    entered = true;
    while (!stop.stop_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    saw_stop = true;
    return {};
  });
  if (!wait_for_condition([&] { return entered.load(); }, kTimeout)) {
    return false;
  }
  if (!handle->cancel() || !handle->done()) {
    return false;
  }
  auto result = handle->result();
  return !result && result.error().code == ErrorCode::Interrupted &&
         wait_for_condition([&] { return saw_stop.load(); }, kTimeout);
}

auto test_task_exception_becomes_failure() -> bool {
  EvaluationPool pool(1);
  auto handle = std::make_shared<EvaluationHandle>();
  pool.submit(handle, [](std::stop_token) -> srunner::engine::Expected<void> {
    throw std::runtime_error("interpreter crashed");
  });
  auto result = handle->result();
  return !result && result.error().code == ErrorCode::EvaluationFailure &&
         result.error().message == "interpreter crashed" && !handle->cancel();
}

auto test_shutdown_cancels_and_refuses() -> bool {
  EvaluationPool pool(1);
  auto running = std::make_shared<EvaluationHandle>();
  std::atomic<bool> entered{false};
  pool.submit(running, [&](std::stop_token stop) -> srunner::engine::Expected<void> {
    entered = true;
    while (!stop.stop_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return {};
  });
  if (!wait_for_condition([&] { return entered.load(); }, kTimeout)) {
    return false;
  }
  pool.shutdown();
  auto late = std::make_shared<EvaluationHandle>();
  pool.submit(late, [](std::stop_token) -> srunner::engine::Expected<void> { return {}; });
  return running->cancelled() && late->cancelled();
}

}  // namespace

int main() {
  TestStats stats;
  run_test("dispatch_runs_jobs_without_waiting", test_dispatch_runs_jobs_without_waiting, stats);
  run_test("dispatch_reuses_idle_threads", test_dispatch_reuses_idle_threads, stats);
  run_test("dispatch_idle_threads_expire", test_dispatch_idle_threads_expire, stats);
  run_test("dispatch_survives_throwing_job", test_dispatch_survives_throwing_job, stats);
  run_test("evaluation_pool_is_bounded", test_evaluation_pool_is_bounded, stats);
  run_test("zero_capacity_clamped", test_zero_capacity_clamped, stats);
  run_test("cancelled_queued_task_never_runs", test_cancelled_queued_task_never_runs, stats);
  run_test("cancel_requests_stop", test_cancel_requests_stop, stats);
  run_test("task_exception_becomes_failure", test_task_exception_becomes_failure, stats);
  run_test("shutdown_cancels_and_refuses", test_shutdown_cancels_and_refuses, stats);
  return report(stats);
}
