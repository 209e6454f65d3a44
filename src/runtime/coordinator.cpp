#include "runtime/coordinator.hpp"

#include <string>
#include <utility>

#include "common/logging/log.hpp"

namespace srunner::runtime {

ExecutionCoordinator::ExecutionCoordinator(engine::ScriptRegistry& registry,
                                           LifecycleEngine& lifecycle, DispatchPool& dispatch)
    : registry_(registry), lifecycle_(lifecycle), dispatch_(dispatch) {}

auto ExecutionCoordinator::submit(std::string body, bool blocking)
  -> engine::Expected<std::shared_ptr<engine::Script>> {
  if (body.empty()) {
    return tl::unexpected(
      engine::make_error(engine::ErrorCode::InvalidArgument, "Script body is empty"));
  }

  auto script = registry_.create(std::move(body));
  srunner::log::info("script_submitted", {{"id", std::to_string(script->id())},
                                          {"blocking", blocking ? "true" : "false"}});

  if (blocking) {
    if (auto driven = lifecycle_.drive(script, true); !driven) {
      srunner::log::warn("blocking script {} finished with {}: {}", script->id(),
                         engine::to_string(driven.error().code), driven.error().message);
    }
    return script;
  }

  auto dispatched = dispatch_.submit([this, script] { lifecycle_.drive(script, false); });
  if (!dispatched) {
    script->mark_failed(dispatched.error().message);
    srunner::log::error("script {} could not be dispatched: {}", script->id(),
                        dispatched.error().message);
  }
  return script;
}

auto ExecutionCoordinator::get(engine::ScriptId id) const
  -> engine::Expected<std::shared_ptr<engine::Script>> {
  return registry_.get(id);
}

auto ExecutionCoordinator::stop(engine::ScriptId id)
  -> engine::Expected<std::shared_ptr<engine::Script>> {
  auto script = registry_.get(id);
  if (!script) {
    return tl::unexpected(script.error());
  }
  if ((*script)->status() != engine::ScriptStatus::Executing) {
    return script;
  }
  auto handle = registry_.cancellation_handle(id);
  if (handle && !handle->done() && handle->cancel()) {
    (*script)->mark_stopped(std::nullopt);
    srunner::log::info("script {} stop requested", id);
  }
  return script;
}

auto ExecutionCoordinator::remove(engine::ScriptId id) -> engine::Expected<void> {
  auto script = registry_.get(id);
  if (!script) {
    return tl::unexpected(script.error());
  }
  const auto status = (*script)->status();
  if (status == engine::ScriptStatus::Executing || status == engine::ScriptStatus::Queued) {
    srunner::log::debug("script {} not deleted while {}", id, engine::to_string(status));
    return {};
  }
  registry_.remove(id);
  registry_.remove_cancellation_handle(id);
  srunner::log::info("script {} deleted", id);
  return {};
}

auto ExecutionCoordinator::list(std::optional<std::string_view> status,
                                std::optional<std::string_view> order_by) const
  -> std::vector<engine::ScriptSnapshot> {
  return list_scripts(registry_, ListQuery::from_text(status, order_by));
}

}  // namespace srunner::runtime
