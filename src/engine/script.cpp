#include "engine/script.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <utility>

namespace srunner::engine {
namespace {

constexpr std::array<ScriptStatus, 5> kAllStatuses = {
  ScriptStatus::Queued,    ScriptStatus::Executing, ScriptStatus::Completed,
  ScriptStatus::Failed,    ScriptStatus::Stopped,
};

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
           return std::toupper(static_cast<unsigned char>(a)) ==
                  std::toupper(static_cast<unsigned char>(b));
         });
}

auto optional_time_json(const std::optional<Timestamp>& time) -> Json {
  if (!time) {
    return nullptr;
  }
  return format_timestamp(*time);
}

}  // namespace

auto to_string(ScriptStatus status) -> std::string_view {
  switch (status) {
    case ScriptStatus::Queued:
      return "QUEUED";
    case ScriptStatus::Executing:
      return "EXECUTING";
    case ScriptStatus::Completed:
      return "COMPLETED";
    case ScriptStatus::Failed:
      return "FAILED";
    case ScriptStatus::Stopped:
      return "STOPPED";
  }
  return "QUEUED";
}

auto parse_status(std::string_view text) -> std::optional<ScriptStatus> {
  for (auto status : kAllStatuses) {
    if (iequals(text, to_string(status))) {
      return status;
    }
  }
  return std::nullopt;
}

Script::Script(ScriptId id, std::string body) : id_(id), body_(std::move(body)) {}

auto Script::status() const -> ScriptStatus {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

auto Script::start_time() const -> std::optional<Timestamp> {
  std::lock_guard<std::mutex> lock(mutex_);
  return start_time_;
}

auto Script::end_time() const -> std::optional<Timestamp> {
  std::lock_guard<std::mutex> lock(mutex_);
  return end_time_;
}

auto Script::stdout_text() const -> std::string {
  std::lock_guard<std::mutex> lock(mutex_);
  return stdout_;
}

auto Script::stderr_text() const -> std::string {
  std::lock_guard<std::mutex> lock(mutex_);
  return stderr_;
}

auto Script::error() const -> std::optional<std::string> {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

auto Script::snapshot() const -> ScriptSnapshot {
  std::lock_guard<std::mutex> lock(mutex_);
  return ScriptSnapshot{
    .id = id_,
    .body = body_,
    .status = status_,
    .start_time = start_time_,
    .end_time = end_time_,
    .stdout_text = stdout_,
    .stderr_text = stderr_,
    .error = error_,
  };
}

auto Script::mark_executing(Timestamp now) -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  if (status_ != ScriptStatus::Queued) {
    return false;
  }
  status_ = ScriptStatus::Executing;
  start_time_ = now;
  return true;
}

auto Script::mark_completed(Timestamp now) -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return finish_locked(ScriptStatus::Completed, now);
}

auto Script::mark_failed(std::string error, Timestamp now) -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!finish_locked(ScriptStatus::Failed, now)) {
    return false;
  }
  error_ = std::move(error);
  return true;
}

auto Script::mark_stopped(std::optional<std::string> error, Timestamp now) -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  if (status_ == ScriptStatus::Stopped) {
    if (!error_ && error) {
      error_ = std::move(error);
    }
    return false;
  }
  if (!finish_locked(ScriptStatus::Stopped, now)) {
    return false;
  }
  if (error) {
    error_ = std::move(error);
  }
  return true;
}

auto Script::set_output(std::string stdout_text, std::string stderr_text) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  stdout_ = std::move(stdout_text);
  stderr_ = std::move(stderr_text);
}

auto Script::finish_locked(ScriptStatus status, Timestamp now) -> bool {
  if (is_terminal(status_)) {
    return false;
  }
  // A record that fails before it ever ran still counts as having started.
  if (!start_time_) {
    start_time_ = now;
  }
  status_ = status;
  end_time_ = std::max(now, *start_time_);
  return true;
}

auto format_timestamp(Timestamp time) -> std::string {
  return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::milliseconds>(time));
}

auto to_json(const ScriptSnapshot& script) -> Json {
  Json json = Json::object();
  json["id"] = script.id;
  json["body"] = script.body;
  json["status"] = std::string(to_string(script.status));
  json["startTime"] = optional_time_json(script.start_time);
  json["endTime"] = optional_time_json(script.end_time);
  json["stdout"] = script.stdout_text;
  json["stderr"] = script.stderr_text;
  if (script.error) {
    json["error"] = *script.error;
  } else {
    json["error"] = nullptr;
  }
  return json;
}

}  // namespace srunner::engine
