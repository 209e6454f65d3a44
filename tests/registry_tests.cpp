#include "test_support.hpp"

#include <algorithm>
#include <set>

#include "runtime/evaluation_pool.hpp"

namespace {

using srunner::engine::ErrorCode;
using srunner::engine::ScriptRegistry;
using srunner::engine::ScriptStatus;

auto test_ids_strictly_increasing() -> bool {
  ScriptRegistry registry;
  auto first = registry.create("a");
  auto second = registry.create("b");
  if (first->id() != 1 || second->id() != 2) {
    std::cerr << "unexpected ids " << first->id() << ", " << second->id() << "\n";
    return false;
  }
  registry.remove(second->id());
  auto third = registry.create("c");
  return third->id() == 3 && first->status() == ScriptStatus::Queued;
}

auto test_get_rejects_invalid_id() -> bool {
  ScriptRegistry registry;
  registry.create("a");
  auto zero = registry.get(0);
  auto negative = registry.get(-5);
  return !zero && zero.error().code == ErrorCode::InvalidArgument && !negative &&
         negative.error().code == ErrorCode::InvalidArgument;
}

auto test_get_unknown_id() -> bool {
  ScriptRegistry registry;
  auto missing = registry.get(999999);
  return !missing && missing.error().code == ErrorCode::NotFound;
}

auto test_get_returns_live_record() -> bool {
  ScriptRegistry registry;
  auto created = registry.create("emit hi");
  auto fetched = registry.get(created->id());
  if (!fetched) {
    return false;
  }
  created->set_output("hi\n", "");
  return (*fetched)->stdout_text() == "hi\n" && (*fetched)->body() == "emit hi";
}

auto test_remove_then_not_found() -> bool {
  ScriptRegistry registry;
  auto script = registry.create("a");
  if (!registry.remove(script->id())) {
    return false;
  }
  auto again = registry.get(script->id());
  return !again && again.error().code == ErrorCode::NotFound && !registry.remove(script->id());
}

auto test_cancellation_handles() -> bool {
  ScriptRegistry registry;
  auto script = registry.create("a");
  if (registry.cancellation_handle(script->id())) {
    return false;
  }
  auto handle = std::make_shared<srunner::runtime::EvaluationHandle>();
  registry.attach_cancellation_handle(script->id(), handle);
  if (registry.cancellation_handle(script->id()) != handle || registry.handle_count() != 1) {
    return false;
  }
  return registry.remove_cancellation_handle(script->id()) &&
         !registry.cancellation_handle(script->id()) && registry.handle_count() == 0;
}

auto test_evict_terminal_keeps_active() -> bool {
  ScriptRegistry registry;
  auto queued = registry.create("q");
  auto executing = registry.create("e");
  auto completed = registry.create("c");
  auto failed = registry.create("f");
  auto stopped = registry.create("s");
  executing->mark_executing();
  completed->mark_executing();
  completed->mark_completed();
  failed->mark_failed("boom");
  stopped->mark_executing();
  stopped->mark_stopped("interrupted");

  if (registry.evict_terminal() != 3) {
    return false;
  }
  return registry.size() == 2 && registry.contains(queued->id()) &&
         registry.contains(executing->id()) && !registry.contains(completed->id());
}

auto test_evict_orphan_handles() -> bool {
  ScriptRegistry registry;
  auto kept = registry.create("k");
  registry.attach_cancellation_handle(kept->id(), std::make_shared<srunner::runtime::EvaluationHandle>());
  registry.attach_cancellation_handle(4242, std::make_shared<srunner::runtime::EvaluationHandle>());
  if (registry.evict_orphan_handles() != 1) {
    return false;
  }
  return registry.cancellation_handle(kept->id()) != nullptr && !registry.cancellation_handle(4242);
}

auto test_concurrent_create_unique_ids() -> bool {
  ScriptRegistry registry;
  constexpr int kThreads = 8;
  constexpr int kIterations = 200;
  std::mutex ids_mutex;
  std::set<srunner::engine::ScriptId> ids;
  auto ok = run_concurrent(kThreads, kIterations, [&](int, int iter) {
    auto script = registry.create("body");
    if (iter % 3 == 0) {
      script->mark_failed("x");
      registry.evict_terminal();
    }
    std::lock_guard<std::mutex> lock(ids_mutex);
    return ids.insert(script->id()).second;
  });
  return ok && ids.size() == static_cast<std::size_t>(kThreads * kIterations) &&
         *ids.rbegin() == kThreads * kIterations;
}

auto test_snapshot_during_mutation() -> bool {
  ScriptRegistry registry;
  std::atomic<bool> done{false};
  std::thread writer([&] {
    for (int i = 0; i < 2000; ++i) {
      auto script = registry.create("w");
      if (i % 2 == 0) {
        registry.remove(script->id());
      }
    }
    done = true;
  });
  bool ids_valid = true;
  while (!done.load()) {
    for (const auto& script : registry.snapshot_all()) {
      ids_valid = ids_valid && script->id() > 0;
    }
  }
  writer.join();
  return ids_valid && registry.size() == 1000;
}

auto test_status_names() -> bool {
  using srunner::engine::parse_status;
  return parse_status("completed") == ScriptStatus::Completed &&
         parse_status("EXECUTING") == ScriptStatus::Executing &&
         parse_status("Stopped") == ScriptStatus::Stopped && !parse_status("RUNNING") &&
         !parse_status("") && srunner::engine::to_string(ScriptStatus::Queued) == "QUEUED";
}

auto test_transitions_are_final() -> bool {
  srunner::engine::Script script(1, "a");
  if (script.mark_completed() == false) {
    return false;
  }
  auto end = script.end_time();
  if (script.mark_failed("late") || script.mark_stopped("late") || script.mark_executing()) {
    return false;
  }
  return script.status() == ScriptStatus::Completed && script.end_time() == end && !script.error();
}

auto test_stopped_is_idempotent() -> bool {
  srunner::engine::Script script(7, "a");
  auto start = std::chrono::system_clock::now();
  script.mark_executing(start);
  if (!script.mark_stopped(std::nullopt, start + std::chrono::seconds(1))) {
    return false;
  }
  auto end = script.end_time();
  if (script.mark_stopped("script execution interrupted", start + std::chrono::seconds(5))) {
    return false;
  }
  return script.status() == ScriptStatus::Stopped && script.end_time() == end &&
         script.error() == "script execution interrupted";
}

auto test_failure_before_start_sets_times() -> bool {
  srunner::engine::Script script(3, "a");
  script.mark_failed("no sandbox");
  auto start = script.start_time();
  auto end = script.end_time();
  return start && end && *start <= *end && script.error() == "no sandbox";
}

auto test_json_rendering() -> bool {
  srunner::engine::Script script(5, "emit x");
  auto queued = srunner::engine::to_json(script.snapshot());
  if (!queued["startTime"].is_null() || !queued["error"].is_null() || queued["status"] != "QUEUED") {
    return false;
  }
  script.mark_executing(std::chrono::system_clock::time_point{} + std::chrono::milliseconds(1500));
  script.set_output("x\n", "");
  script.mark_failed("boom");
  auto failed = srunner::engine::to_json(script.snapshot());
  return failed["id"] == 5 && failed["status"] == "FAILED" &&
         failed["startTime"] == "1970-01-01T00:00:01.500Z" && failed["stdout"] == "x\n" &&
         failed["error"] == "boom" && failed["endTime"].is_string();
}

}  // namespace

int main() {
  TestStats stats;
  run_test("ids_strictly_increasing", test_ids_strictly_increasing, stats);
  run_test("get_rejects_invalid_id", test_get_rejects_invalid_id, stats);
  run_test("get_unknown_id", test_get_unknown_id, stats);
  run_test("get_returns_live_record", test_get_returns_live_record, stats);
  run_test("remove_then_not_found", test_remove_then_not_found, stats);
  run_test("cancellation_handles", test_cancellation_handles, stats);
  run_test("evict_terminal_keeps_active", test_evict_terminal_keeps_active, stats);
  run_test("evict_orphan_handles", test_evict_orphan_handles, stats);
  run_test("concurrent_create_unique_ids", test_concurrent_create_unique_ids, stats);
  run_test("snapshot_during_mutation", test_snapshot_during_mutation, stats);
  run_test("status_names", test_status_names, stats);
  run_test("transitions_are_final", test_transitions_are_final, stats);
  run_test("stopped_is_idempotent", test_stopped_is_idempotent, stats);
  run_test("failure_before_start_sets_times", test_failure_before_start_sets_times, stats);
  run_test("json_rendering", test_json_rendering, stats);
  return report(stats);
}
