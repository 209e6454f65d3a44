#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace srunner::engine {

using Json = nlohmann::json;
using ScriptId = std::int64_t;
using Timestamp = std::chrono::system_clock::time_point;

enum class ScriptStatus {
  Queued,
  Executing,
  Completed,
  Failed,
  Stopped,
};

auto to_string(ScriptStatus status) -> std::string_view;
/// Parse a status name in any letter case; unknown names yield nullopt.
auto parse_status(std::string_view text) -> std::optional<ScriptStatus>;

inline auto is_terminal(ScriptStatus status) -> bool {
  return status == ScriptStatus::Completed || status == ScriptStatus::Failed ||
         status == ScriptStatus::Stopped;
}

/// Point-in-time copy of a script record.
struct ScriptSnapshot {
  ScriptId id = 0;
  std::string body;
  ScriptStatus status = ScriptStatus::Queued;
  std::optional<Timestamp> start_time;
  std::optional<Timestamp> end_time;
  std::string stdout_text;
  std::string stderr_text;
  std::optional<std::string> error;
};

/// One submitted script and its outcome.
///
/// Records are shared between the registry, the lifecycle run that drives
/// them and any caller holding a reference, so every mutable field is guarded
/// by the record's own mutex. Status changes go through the mark_* methods,
/// which refuse to leave a terminal state and write end_time at most once.
class Script {
 public:
  Script(ScriptId id, std::string body);

  Script(const Script&) = delete;
  auto operator=(const Script&) -> Script& = delete;

  auto id() const -> ScriptId { return id_; }
  auto body() const -> const std::string& { return body_; }

  auto status() const -> ScriptStatus;
  auto start_time() const -> std::optional<Timestamp>;
  auto end_time() const -> std::optional<Timestamp>;
  auto stdout_text() const -> std::string;
  auto stderr_text() const -> std::string;
  auto error() const -> std::optional<std::string>;
  auto snapshot() const -> ScriptSnapshot;

  /// QUEUED -> EXECUTING. Returns false when the record already left QUEUED.
  auto mark_executing(Timestamp now = std::chrono::system_clock::now()) -> bool;
  auto mark_completed(Timestamp now = std::chrono::system_clock::now()) -> bool;
  auto mark_failed(std::string error, Timestamp now = std::chrono::system_clock::now()) -> bool;
  /// Idempotent: a second STOPPED keeps end_time and only fills a missing error.
  auto mark_stopped(std::optional<std::string> error,
                    Timestamp now = std::chrono::system_clock::now()) -> bool;

  auto set_output(std::string stdout_text, std::string stderr_text) -> void;

 private:
  auto finish_locked(ScriptStatus status, Timestamp now) -> bool;

  const ScriptId id_;
  const std::string body_;

  mutable std::mutex mutex_;
  ScriptStatus status_ = ScriptStatus::Queued;
  std::optional<Timestamp> start_time_;
  std::optional<Timestamp> end_time_;
  std::string stdout_;
  std::string stderr_;
  std::optional<std::string> error_;
};

/// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T10:00:00.125Z.
auto format_timestamp(Timestamp time) -> std::string;

auto to_json(const ScriptSnapshot& script) -> Json;

}  // namespace srunner::engine
