#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/script.hpp"
#include "engine/script_registry.hpp"
#include "runtime/dispatch_pool.hpp"
#include "runtime/lifecycle.hpp"
#include "runtime/listing.hpp"

namespace srunner::runtime {

/// Public entry point for script submission and control.
class ExecutionCoordinator {
 public:
  ExecutionCoordinator(engine::ScriptRegistry& registry, LifecycleEngine& lifecycle,
                       DispatchPool& dispatch);

  /// Create a record and run it. A blocking submission returns once the record
  /// is terminal; a non-blocking one returns right away while the run proceeds
  /// on the dispatch pool.
  auto submit(std::string body, bool blocking) -> engine::Expected<std::shared_ptr<engine::Script>>;

  auto get(engine::ScriptId id) const -> engine::Expected<std::shared_ptr<engine::Script>>;

  /// Interrupt an EXECUTING script. For any other status this returns the
  /// record unchanged.
  auto stop(engine::ScriptId id) -> engine::Expected<std::shared_ptr<engine::Script>>;

  /// Delete a terminal record. QUEUED and EXECUTING records are left alone.
  auto remove(engine::ScriptId id) -> engine::Expected<void>;

  auto list(std::optional<std::string_view> status = std::nullopt,
            std::optional<std::string_view> order_by = std::nullopt) const
    -> std::vector<engine::ScriptSnapshot>;

 private:
  engine::ScriptRegistry& registry_;
  LifecycleEngine& lifecycle_;
  DispatchPool& dispatch_;
};

}  // namespace srunner::runtime
