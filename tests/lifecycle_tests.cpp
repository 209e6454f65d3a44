#include "test_support.hpp"

#include "runtime/evaluation_pool.hpp"
#include "runtime/lifecycle.hpp"

namespace {

using srunner::engine::ErrorCode;
using srunner::engine::ScriptRegistry;
using srunner::engine::ScriptStatus;
using srunner::runtime::EvaluationPool;
using srunner::runtime::LifecycleConfig;
using srunner::runtime::LifecycleEngine;

constexpr auto kTimeout = std::chrono::milliseconds(5000);

struct Fixture {
  explicit Fixture(std::size_t capacity = 2)
      : probe(std::make_shared<SandboxProbe>()), pool(capacity),
        lifecycle(registry, pool, scripted_factory(probe),
                  LifecycleConfig{std::chrono::milliseconds(1)}) {}

  std::shared_ptr<SandboxProbe> probe;
  ScriptRegistry registry;
  EvaluationPool pool;
  LifecycleEngine lifecycle;
};

auto test_drive_completes_and_mirrors_output() -> bool {
  Fixture fixture;
  auto script = fixture.registry.create("emit one\nwarn two\nemit three");
  auto driven = fixture.lifecycle.drive(script, true);
  return driven && script->status() == ScriptStatus::Completed &&
         script->stdout_text() == "one\nthree\n" && script->stderr_text() == "two\n" &&
         fixture.probe->created.load() == 1 && fixture.probe->closed.load() == 1 &&
         fixture.probe->forced.load() == 0 && fixture.registry.handle_count() == 0;
}

auto test_output_visible_while_executing() -> bool {
  Fixture fixture;
  auto script = fixture.registry.create("emit early\nsleep 300\nemit late");
  std::thread driver([&] { (void)fixture.lifecycle.drive(script, false); });
  bool partial = wait_for_condition(
    [&] { return script->stdout_text() == "early\n" && status_is(script, ScriptStatus::Executing); },
    kTimeout);
  driver.join();
  return partial && script->stdout_text() == "early\nlate\n" &&
         script->status() == ScriptStatus::Completed;
}

auto test_handle_attached_while_running() -> bool {
  Fixture fixture;
  auto script = fixture.registry.create("hang");
  std::thread driver([&] { (void)fixture.lifecycle.drive(script, false); });
  bool attached = wait_for_condition(
    [&] { return fixture.registry.cancellation_handle(script->id()) != nullptr; }, kTimeout);
  auto handle = fixture.registry.cancellation_handle(script->id());
  bool cancelled = handle && handle->cancel();
  driver.join();
  return attached && cancelled && script->status() == ScriptStatus::Stopped &&
         script->error() == "script execution interrupted" && fixture.probe->forced.load() == 1 &&
         fixture.registry.handle_count() == 0;
}

auto test_blocking_failure_returned() -> bool {
  Fixture fixture;
  auto script = fixture.registry.create("fail SyntaxError: unexpected token");
  auto driven = fixture.lifecycle.drive(script, true);
  return !driven && driven.error().code == ErrorCode::EvaluationFailure &&
         script->status() == ScriptStatus::Failed &&
         script->error() == "SyntaxError: unexpected token";
}

auto test_non_blocking_failure_recorded_only() -> bool {
  Fixture fixture;
  auto script = fixture.registry.create("fail boom");
  auto driven = fixture.lifecycle.drive(script, false);
  return driven && script->status() == ScriptStatus::Failed && script->error() == "boom";
}

auto test_missing_factory_fails() -> bool {
  ScriptRegistry registry;
  EvaluationPool pool(1);
  LifecycleEngine lifecycle(registry, pool, srunner::engine::SandboxFactory{});
  auto script = registry.create("emit x");
  auto driven = lifecycle.drive(script, true);
  return !driven && driven.error().code == ErrorCode::Internal &&
         script->status() == ScriptStatus::Failed && script->start_time() && script->end_time();
}

auto test_pool_shutdown_stops_queued_run() -> bool {
  Fixture fixture(1);
  auto blocker = fixture.registry.create("hang");
  auto waiting = fixture.registry.create("emit never");
  std::thread first([&] { (void)fixture.lifecycle.drive(blocker, false); });
  if (!wait_for_condition([&] { return status_is(blocker, ScriptStatus::Executing); }, kTimeout)) {
    fixture.pool.shutdown();
    first.join();
    return false;
  }
  std::thread second([&] { (void)fixture.lifecycle.drive(waiting, false); });
  bool queued = wait_for_condition(
    [&] { return fixture.registry.cancellation_handle(waiting->id()) != nullptr; }, kTimeout);
  fixture.pool.shutdown();
  first.join();
  second.join();
  return queued && blocker->status() == ScriptStatus::Stopped &&
         waiting->status() == ScriptStatus::Stopped && waiting->stdout_text().empty();
}

}  // namespace

int main() {
  TestStats stats;
  run_test("drive_completes_and_mirrors_output", test_drive_completes_and_mirrors_output, stats);
  run_test("output_visible_while_executing", test_output_visible_while_executing, stats);
  run_test("handle_attached_while_running", test_handle_attached_while_running, stats);
  run_test("blocking_failure_returned", test_blocking_failure_returned, stats);
  run_test("non_blocking_failure_recorded_only", test_non_blocking_failure_recorded_only, stats);
  run_test("missing_factory_fails", test_missing_factory_fails, stats);
  run_test("pool_shutdown_stops_queued_run", test_pool_shutdown_stops_queued_run, stats);
  return report(stats);
}
