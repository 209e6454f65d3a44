#include "runtime/lifecycle.hpp"

#include <format>
#include <string>
#include <utility>

#include "common/logging/log.hpp"

namespace srunner::runtime {
namespace {

/// Closes the sandbox when the run leaves scope; `force` interrupts it first.
struct SandboxLease {
  std::shared_ptr<engine::Sandbox> sandbox;
  bool force = false;

  ~SandboxLease() {
    if (sandbox) {
      sandbox->close(force);
    }
  }
};

auto mirror(engine::Script& script, const engine::Sandbox& sandbox) -> engine::Expected<void> {
  auto out = sandbox.stdout_text();
  if (!out) {
    return tl::unexpected(out.error());
  }
  auto err = sandbox.stderr_text();
  if (!err) {
    return tl::unexpected(err.error());
  }
  script.set_output(std::move(*out), std::move(*err));
  return {};
}

}  // namespace

LifecycleEngine::LifecycleEngine(engine::ScriptRegistry& registry, EvaluationPool& pool,
                                 engine::SandboxFactory sandbox_factory, LifecycleConfig config)
    : registry_(registry), pool_(pool), sandbox_factory_(std::move(sandbox_factory)),
      config_(config) {}

auto LifecycleEngine::drive(const std::shared_ptr<engine::Script>& script, bool blocking)
  -> engine::Expected<void> {
  const auto id = script->id();

  if (!sandbox_factory_) {
    return finish(*script,
                  tl::unexpected(engine::make_error(engine::ErrorCode::Internal,
                                                    "no sandbox factory configured")),
                  blocking);
  }
  auto acquired = sandbox_factory_();
  if (!acquired) {
    return finish(*script, tl::unexpected(acquired.error()), blocking);
  }
  SandboxLease lease{std::move(*acquired)};
  auto sandbox = lease.sandbox;

  auto handle = std::make_shared<EvaluationHandle>();
  registry_.attach_cancellation_handle(id, handle);
  pool_.submit(
    handle,
    [sandbox, script](std::stop_token stop) { return sandbox->evaluate(script->body(), stop); },
    [script] {
      if (script->mark_executing()) {
        srunner::log::info("script {} executing", script->id());
      }
    });

  engine::Expected<void> mirrored;
  while (!handle->wait_for(config_.output_poll_interval)) {
    mirrored = mirror(*script, *sandbox);
    if (!mirrored) {
      break;
    }
  }

  engine::Expected<void> outcome;
  if (!mirrored) {
    handle->cancel();
    lease.force = true;
    outcome = tl::unexpected(mirrored.error());
  } else if (auto final_mirror = mirror(*script, *sandbox); !final_mirror) {
    lease.force = handle->cancelled();
    outcome = tl::unexpected(final_mirror.error());
  } else if (handle->cancelled()) {
    lease.force = true;
    sandbox->close(true);
    outcome = handle->result();
  } else {
    outcome = handle->result();
  }

  registry_.remove_cancellation_handle(id);
  return finish(*script, outcome, blocking);
}

auto LifecycleEngine::finish(engine::Script& script, const engine::Expected<void>& outcome,
                             bool blocking) -> engine::Expected<void> {
  const auto id = script.id();
  if (outcome) {
    if (script.mark_completed()) {
      srunner::log::info("script {} completed", id);
    }
    return {};
  }

  const auto& error = outcome.error();
  if (error.code == engine::ErrorCode::Interrupted) {
    if (script.mark_stopped(error.message)) {
      srunner::log::info("script {} stopped", id);
    }
    return {};
  }

  if (script.mark_failed(error.message)) {
    srunner::log::info("script {} failed ({}): {}", id, engine::to_string(error.code), error.message);
  }
  if (blocking) {
    return tl::unexpected(error);
  }
  return {};
}

}  // namespace srunner::runtime
