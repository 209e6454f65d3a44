#pragma once

#include <string>
#include <string_view>

#include "engine/error.hpp"
#include "engine/script.hpp"
#include "runtime/coordinator.hpp"

namespace srunner::runtime {

struct ApiResponse {
  int status = 200;
  engine::Json body;
};

/// One-line JSON `{"status":..,"body":..}`. Script output is arbitrary bytes,
/// so invalid UTF-8 is written as U+FFFD instead of failing.
auto to_line(const ApiResponse& response) -> std::string;

/// HTTP-style status for an error code: 400, 404 or 500.
auto status_for(engine::ErrorCode code) -> int;

/// JSON request surface over the coordinator.
///
/// Requests carry an "op" field (execute, list, get, stop, delete) plus the
/// operation's arguments; responses pair a status code with a JSON body.
class ScriptApi {
 public:
  explicit ScriptApi(ExecutionCoordinator& coordinator);

  auto handle(const engine::Json& request) -> ApiResponse;
  /// Parse one JSON document and handle it; malformed text yields 400.
  auto handle_text(std::string_view text) -> ApiResponse;

 private:
  auto execute(const engine::Json& request) -> ApiResponse;
  auto list(const engine::Json& request) -> ApiResponse;
  auto get(const engine::Json& request) -> ApiResponse;
  auto stop(const engine::Json& request) -> ApiResponse;
  auto remove(const engine::Json& request) -> ApiResponse;

  ExecutionCoordinator& coordinator_;
};

}  // namespace srunner::runtime
