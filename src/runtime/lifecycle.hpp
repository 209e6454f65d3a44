#pragma once

#include <chrono>
#include <memory>

#include "engine/error.hpp"
#include "engine/sandbox.hpp"
#include "engine/script.hpp"
#include "engine/script_registry.hpp"
#include "runtime/evaluation_pool.hpp"

namespace srunner::runtime {

struct LifecycleConfig {
  /// Upper bound on the delay between two output mirrors while a script runs.
  std::chrono::milliseconds output_poll_interval{5};
};

/// Drives one script record from QUEUED to a terminal status.
///
/// Each run acquires its own sandbox, queues the evaluation on the bounded
/// pool, mirrors the sandbox output into the record until the evaluation is
/// done and then applies the terminal transition. The sandbox is closed on
/// every exit path.
class LifecycleEngine {
 public:
  LifecycleEngine(engine::ScriptRegistry& registry, EvaluationPool& pool,
                  engine::SandboxFactory sandbox_factory, LifecycleConfig config = {});

  /// Blocks the calling thread until the record is terminal. With `blocking`
  /// set, a failed evaluation is also returned to the caller; otherwise it is
  /// only recorded on the script.
  auto drive(const std::shared_ptr<engine::Script>& script, bool blocking) -> engine::Expected<void>;

 private:
  auto finish(engine::Script& script, const engine::Expected<void>& outcome, bool blocking)
    -> engine::Expected<void>;

  engine::ScriptRegistry& registry_;
  EvaluationPool& pool_;
  engine::SandboxFactory sandbox_factory_;
  LifecycleConfig config_;
};

}  // namespace srunner::runtime
