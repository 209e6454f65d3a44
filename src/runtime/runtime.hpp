#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include "engine/process_sandbox.hpp"
#include "engine/sandbox.hpp"
#include "engine/script_registry.hpp"
#include "runtime/coordinator.hpp"
#include "runtime/dispatch_pool.hpp"
#include "runtime/evaluation_pool.hpp"
#include "runtime/lifecycle.hpp"
#include "runtime/sweeper.hpp"

namespace srunner::runtime {

/// Configuration for the script runtime.
struct RuntimeConfig {
  /// Number of scripts that may evaluate at the same time.
  std::size_t worker_threads = 100;
  /// Delay bound between two output mirrors of a running script.
  std::chrono::milliseconds output_poll_interval{5};
  /// Interval between cleanup sweeps.
  std::chrono::milliseconds sweep_interval{std::chrono::hours(1)};
  /// Delay before the first sweep.
  std::chrono::milliseconds first_sweep_delay{0};
  /// Idle time after which a dispatch thread exits.
  std::chrono::milliseconds dispatch_keep_alive{std::chrono::seconds(60)};
  /// Process sandbox settings, used when no sandbox_factory is given.
  engine::ProcessSandboxConfig sandbox;
  /// Custom sandbox provider.
  engine::SandboxFactory sandbox_factory;
};

/// Build a RuntimeConfig from the command-line flags.
auto runtime_config_from_flags() -> RuntimeConfig;

/// Owns the registry, both pools, the lifecycle engine, the coordinator and
/// the cleanup sweeper for the lifetime of the process.
class Runtime {
 public:
  explicit Runtime(RuntimeConfig config = {});
  /// Cancels running scripts, then drains the pools.
  ~Runtime();

  Runtime(const Runtime&) = delete;
  auto operator=(const Runtime&) -> Runtime& = delete;

  auto coordinator() -> ExecutionCoordinator& { return *coordinator_; }
  auto registry() -> engine::ScriptRegistry& { return registry_; }
  auto sweeper() -> CleanupSweeper& { return *sweeper_; }
  auto evaluation_pool() -> EvaluationPool& { return *evaluation_pool_; }
  auto dispatch_pool() -> DispatchPool& { return *dispatch_pool_; }

 private:
  engine::ScriptRegistry registry_;
  std::unique_ptr<EvaluationPool> evaluation_pool_;
  std::unique_ptr<LifecycleEngine> lifecycle_;
  std::unique_ptr<DispatchPool> dispatch_pool_;
  std::unique_ptr<ExecutionCoordinator> coordinator_;
  std::unique_ptr<CleanupSweeper> sweeper_;
};

}  // namespace srunner::runtime
