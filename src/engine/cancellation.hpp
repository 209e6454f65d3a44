#pragma once

namespace srunner::engine {

/// Live reference to one in-flight evaluation.
class CancellationHandle {
 public:
  virtual ~CancellationHandle() = default;

  /// Request cooperative interruption. Returns true only when this call moved
  /// the evaluation into the cancelled state; false if it had already
  /// finished or been cancelled.
  virtual auto cancel() -> bool = 0;
  virtual auto done() const -> bool = 0;
  virtual auto cancelled() const -> bool = 0;
};

}  // namespace srunner::engine
