#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "engine/error.hpp"

namespace srunner::engine {

/// Growable text buffer written by a sandbox and read by other threads.
/// A fault is sticky: once the capture stream broke, reads keep failing.
class OutputBuffer {
 public:
  auto append(std::string_view data) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.append(data);
  }

  auto fail(EngineError error) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fault_) {
      fault_ = std::move(error);
    }
  }

  auto read() const -> Expected<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fault_) {
      return tl::unexpected(*fault_);
    }
    return data_;
  }

 private:
  mutable std::mutex mutex_;
  std::string data_;
  std::optional<EngineError> fault_;
};

/// Isolated interpreter instance scoped to a single script execution.
///
/// evaluate() runs on a pooled worker thread while stdout_text() and
/// stderr_text() are polled from the thread driving the execution. A sandbox
/// is never reused: after close() it must not be evaluated again.
class Sandbox {
 public:
  virtual ~Sandbox() = default;

  /// Run the source to completion. Returns EvaluationFailure when the script
  /// fails and Interrupted when stop was requested through the token or by
  /// close(true) while running.
  virtual auto evaluate(std::string_view source, std::stop_token stop) -> Expected<void> = 0;

  /// Release the sandbox. With force set a running evaluation is interrupted
  /// first. Safe to call more than once.
  virtual auto close(bool force) -> void = 0;

  auto stdout_text() const -> Expected<std::string> { return stdout_.read(); }
  auto stderr_text() const -> Expected<std::string> { return stderr_.read(); }

 protected:
  OutputBuffer stdout_;
  OutputBuffer stderr_;
};

using SandboxFactory = std::function<Expected<std::shared_ptr<Sandbox>>()>;

}  // namespace srunner::engine
