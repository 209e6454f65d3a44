#include "engine/script_registry.hpp"

#include <format>
#include <mutex>
#include <utility>

namespace srunner::engine {

auto ScriptRegistry::create(std::string body) -> std::shared_ptr<Script> {
  const ScriptId id = last_id_.fetch_add(1, std::memory_order_acq_rel) + 1;
  auto script = std::make_shared<Script>(id, std::move(body));
  std::unique_lock<std::shared_mutex> lock(scripts_mutex_);
  scripts_.emplace(id, script);
  return script;
}

auto ScriptRegistry::get(ScriptId id) const -> Expected<std::shared_ptr<Script>> {
  if (id <= 0) {
    return tl::unexpected(make_error(ErrorCode::InvalidArgument, "Invalid script ID"));
  }
  std::shared_lock<std::shared_mutex> lock(scripts_mutex_);
  auto it = scripts_.find(id);
  if (it == scripts_.end()) {
    return tl::unexpected(
      make_error(ErrorCode::NotFound, std::format("Script with ID {} does not exist.", id)));
  }
  return it->second;
}

auto ScriptRegistry::contains(ScriptId id) const -> bool {
  std::shared_lock<std::shared_mutex> lock(scripts_mutex_);
  return scripts_.contains(id);
}

auto ScriptRegistry::remove(ScriptId id) -> bool {
  std::unique_lock<std::shared_mutex> lock(scripts_mutex_);
  return scripts_.erase(id) > 0;
}

auto ScriptRegistry::snapshot_all() const -> std::vector<std::shared_ptr<Script>> {
  std::shared_lock<std::shared_mutex> lock(scripts_mutex_);
  std::vector<std::shared_ptr<Script>> scripts;
  scripts.reserve(scripts_.size());
  for (const auto& [id, script] : scripts_) {
    scripts.push_back(script);
  }
  return scripts;
}

auto ScriptRegistry::attach_cancellation_handle(ScriptId id,
                                                std::shared_ptr<CancellationHandle> handle) -> void {
  std::unique_lock<std::shared_mutex> lock(handles_mutex_);
  handles_[id] = std::move(handle);
}

auto ScriptRegistry::cancellation_handle(ScriptId id) const -> std::shared_ptr<CancellationHandle> {
  std::shared_lock<std::shared_mutex> lock(handles_mutex_);
  auto it = handles_.find(id);
  if (it == handles_.end()) {
    return nullptr;
  }
  return it->second;
}

auto ScriptRegistry::remove_cancellation_handle(ScriptId id) -> bool {
  std::unique_lock<std::shared_mutex> lock(handles_mutex_);
  return handles_.erase(id) > 0;
}

auto ScriptRegistry::evict_terminal() -> std::size_t {
  std::unique_lock<std::shared_mutex> lock(scripts_mutex_);
  return std::erase_if(scripts_, [](const auto& entry) {
    return is_terminal(entry.second->status());
  });
}

auto ScriptRegistry::evict_orphan_handles() -> std::size_t {
  // Lock order is scripts then handles everywhere both are held.
  std::shared_lock<std::shared_mutex> scripts_lock(scripts_mutex_);
  std::unique_lock<std::shared_mutex> handles_lock(handles_mutex_);
  return std::erase_if(handles_, [this](const auto& entry) {
    return !scripts_.contains(entry.first);
  });
}

auto ScriptRegistry::size() const -> std::size_t {
  std::shared_lock<std::shared_mutex> lock(scripts_mutex_);
  return scripts_.size();
}

auto ScriptRegistry::handle_count() const -> std::size_t {
  std::shared_lock<std::shared_mutex> lock(handles_mutex_);
  return handles_.size();
}

}  // namespace srunner::engine
