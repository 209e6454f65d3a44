#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace srunner::engine {

enum class ErrorCode {
  InvalidArgument,
  NotFound,
  EvaluationFailure,
  Interrupted,
  IOFailure,
  Internal,
};

struct EngineError {
  ErrorCode code = ErrorCode::Internal;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, EngineError>;

inline auto make_error(ErrorCode code, std::string message) -> EngineError {
  return EngineError{code, std::move(message)};
}

inline auto to_string(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::EvaluationFailure:
      return "EvaluationFailure";
    case ErrorCode::Interrupted:
      return "Interrupted";
    case ErrorCode::IOFailure:
      return "IOFailure";
    case ErrorCode::Internal:
      return "Internal";
  }
  return "Internal";
}

}  // namespace srunner::engine
