#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "engine/cancellation.hpp"
#include "engine/error.hpp"
#include "engine/script.hpp"

namespace srunner::engine {

/// Process-wide store of script records and the cancellation handles of their
/// evaluations. All methods are safe to call concurrently.
class ScriptRegistry {
 public:
  ScriptRegistry() = default;
  ScriptRegistry(const ScriptRegistry&) = delete;
  auto operator=(const ScriptRegistry&) -> ScriptRegistry& = delete;

  /// Store a new QUEUED record under the next id. Ids start at 1 and are never
  /// reused, even after the record is removed.
  auto create(std::string body) -> std::shared_ptr<Script>;
  auto get(ScriptId id) const -> Expected<std::shared_ptr<Script>>;
  auto contains(ScriptId id) const -> bool;
  auto remove(ScriptId id) -> bool;
  auto snapshot_all() const -> std::vector<std::shared_ptr<Script>>;

  auto attach_cancellation_handle(ScriptId id, std::shared_ptr<CancellationHandle> handle) -> void;
  /// Null when no handle is attached.
  auto cancellation_handle(ScriptId id) const -> std::shared_ptr<CancellationHandle>;
  auto remove_cancellation_handle(ScriptId id) -> bool;

  /// Drop every record whose status is terminal; returns how many went.
  auto evict_terminal() -> std::size_t;
  /// Drop handles whose script id is no longer stored; returns how many went.
  auto evict_orphan_handles() -> std::size_t;

  auto size() const -> std::size_t;
  auto handle_count() const -> std::size_t;

 private:
  std::atomic<ScriptId> last_id_{0};
  mutable std::shared_mutex scripts_mutex_;
  std::unordered_map<ScriptId, std::shared_ptr<Script>> scripts_;
  mutable std::shared_mutex handles_mutex_;
  std::unordered_map<ScriptId, std::shared_ptr<CancellationHandle>> handles_;
};

}  // namespace srunner::engine
