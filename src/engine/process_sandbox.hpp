#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include "engine/error.hpp"
#include "engine/sandbox.hpp"

namespace srunner::engine {

struct ProcessSandboxConfig {
  /// Interpreter executable; the script file path is appended to its args.
  std::string interpreter = "/bin/sh";
  std::vector<std::string> interpreter_args;
  /// Parent of the per-sandbox scratch directories (temp dir when empty).
  std::filesystem::path scratch_root;
  std::string script_name = "script";
};

/// Sandbox that runs the script body in a child interpreter process.
///
/// Each instance owns a private scratch directory holding the script file and
/// at most one child process, started in its own process group so that an
/// interrupt also reaches anything the script spawned. Output is drained from
/// the child's pipes into the sandbox buffers as it arrives.
class ProcessSandbox final : public Sandbox {
 public:
  static auto create(ProcessSandboxConfig config) -> Expected<std::shared_ptr<ProcessSandbox>>;

  ~ProcessSandbox() override;

  ProcessSandbox(const ProcessSandbox&) = delete;
  auto operator=(const ProcessSandbox&) -> ProcessSandbox& = delete;

  auto evaluate(std::string_view source, std::stop_token stop) -> Expected<void> override;
  auto close(bool force) -> void override;

  auto scratch_dir() const -> const std::filesystem::path& { return scratch_dir_; }

 private:
  ProcessSandbox(ProcessSandboxConfig config, std::filesystem::path scratch_dir);

  auto write_script(std::string_view source) -> Expected<std::filesystem::path>;
  auto spawn(const std::filesystem::path& script, int stdout_fd, int stderr_fd) -> Expected<void>;
  auto drain(int stdout_fd, int stderr_fd) -> int;
  auto try_reap(int& status, bool block) -> bool;
  auto interrupt() -> void;

  ProcessSandboxConfig config_;
  std::filesystem::path scratch_dir_;
  std::mutex mutex_;
  pid_t pid_ = -1;
  bool closed_ = false;
  bool started_ = false;
  bool reaped_ = false;
  std::atomic<bool> interrupted_{false};
};

auto make_process_sandbox_factory(ProcessSandboxConfig config) -> SandboxFactory;

}  // namespace srunner::engine
