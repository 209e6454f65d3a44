#include "runtime/script_api.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <optional>
#include <string>

#include "common/logging/log.hpp"

namespace srunner::runtime {
namespace {

auto error_response(int status, std::string message) -> ApiResponse {
  return ApiResponse{status, engine::Json{{"error", std::move(message)}}};
}

auto error_response(const engine::EngineError& error) -> ApiResponse {
  const int status = status_for(error.code);
  if (status >= 500) {
    srunner::log::error("request failed ({}): {}", engine::to_string(error.code), error.message);
  }
  return error_response(status, error.message);
}

auto optional_string(const engine::Json& request, const char* key) -> std::optional<std::string> {
  auto it = request.find(key);
  if (it == request.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

auto parse_id(const engine::Json& request) -> engine::Expected<engine::ScriptId> {
  auto it = request.find("id");
  if (it == request.end() || !it->is_number_integer()) {
    return tl::unexpected(engine::make_error(engine::ErrorCode::InvalidArgument, "Invalid script ID"));
  }
  return it->get<engine::ScriptId>();
}

/// Accepts a JSON boolean or the text "true" in any case; anything else is false.
auto parse_blocking(const engine::Json& request) -> bool {
  auto it = request.find("blocking");
  if (it == request.end()) {
    return false;
  }
  if (it->is_boolean()) {
    return it->get<bool>();
  }
  if (it->is_string()) {
    auto text = it->get<std::string>();
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text == "true";
  }
  return false;
}

}  // namespace

auto to_line(const ApiResponse& response) -> std::string {
  engine::Json line = {{"status", response.status}, {"body", response.body}};
  return line.dump(-1, ' ', false, engine::Json::error_handler_t::replace);
}

auto status_for(engine::ErrorCode code) -> int {
  switch (code) {
    case engine::ErrorCode::InvalidArgument:
      return 400;
    case engine::ErrorCode::NotFound:
      return 404;
    case engine::ErrorCode::EvaluationFailure:
    case engine::ErrorCode::Interrupted:
    case engine::ErrorCode::IOFailure:
    case engine::ErrorCode::Internal:
      return 500;
  }
  return 500;
}

ScriptApi::ScriptApi(ExecutionCoordinator& coordinator) : coordinator_(coordinator) {}

auto ScriptApi::handle_text(std::string_view text) -> ApiResponse {
  auto request = engine::Json::parse(text, nullptr, false);
  if (request.is_discarded()) {
    return error_response(400, "Bad request: malformed JSON");
  }
  return handle(request);
}

auto ScriptApi::handle(const engine::Json& request) -> ApiResponse {
  if (!request.is_object()) {
    return error_response(400, "Bad request: expected a JSON object");
  }
  auto op = optional_string(request, "op");
  if (!op) {
    return error_response(400, "Bad request: missing op");
  }
  if (*op == "execute") {
    return execute(request);
  }
  if (*op == "list") {
    return list(request);
  }
  if (*op == "get") {
    return get(request);
  }
  if (*op == "stop") {
    return stop(request);
  }
  if (*op == "delete") {
    return remove(request);
  }
  return error_response(400, std::format("Bad request: unknown op '{}'", *op));
}

auto ScriptApi::execute(const engine::Json& request) -> ApiResponse {
  auto body = optional_string(request, "script");
  if (!body) {
    return error_response(400, "Bad request: Script is null");
  }
  const bool blocking = parse_blocking(request);
  auto script = coordinator_.submit(std::move(*body), blocking);
  if (!script) {
    return error_response(script.error());
  }
  return ApiResponse{blocking ? 200 : 202, engine::to_json((*script)->snapshot())};
}

auto ScriptApi::list(const engine::Json& request) -> ApiResponse {
  auto status = optional_string(request, "status");
  auto order_by = optional_string(request, "orderBy");
  auto scripts = coordinator_.list(status ? std::optional<std::string_view>(*status) : std::nullopt,
                                   order_by ? std::optional<std::string_view>(*order_by) : std::nullopt);
  engine::Json body = engine::Json::array();
  for (const auto& script : scripts) {
    body.push_back(engine::to_json(script));
  }
  return ApiResponse{200, std::move(body)};
}

auto ScriptApi::get(const engine::Json& request) -> ApiResponse {
  auto id = parse_id(request);
  if (!id) {
    return error_response(id.error());
  }
  auto script = coordinator_.get(*id);
  if (!script) {
    return error_response(script.error());
  }
  return ApiResponse{200, engine::to_json((*script)->snapshot())};
}

auto ScriptApi::stop(const engine::Json& request) -> ApiResponse {
  auto id = parse_id(request);
  if (!id) {
    return error_response(id.error());
  }
  auto script = coordinator_.stop(*id);
  if (!script) {
    return error_response(script.error());
  }
  return ApiResponse{200, engine::to_json((*script)->snapshot())};
}

auto ScriptApi::remove(const engine::Json& request) -> ApiResponse {
  auto id = parse_id(request);
  if (!id) {
    return error_response(id.error());
  }
  if (auto removed = coordinator_.remove(*id); !removed) {
    return error_response(removed.error());
  }
  return ApiResponse{200, nullptr};
}

}  // namespace srunner::runtime
