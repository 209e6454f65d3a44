#include "engine/process_sandbox.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <format>
#include <fstream>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "common/logging/log.hpp"

extern char** environ;

namespace srunner::engine {
namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr int kPollTimeoutMs = 50;

auto errno_message(std::string_view prefix, int err) -> std::string {
  return std::format("{}: {}", prefix, std::generic_category().message(err));
}

class FileDescriptor {
 public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() { reset(); }

  FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  auto operator=(FileDescriptor&& other) noexcept -> FileDescriptor& {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }
  FileDescriptor(const FileDescriptor&) = delete;
  auto operator=(const FileDescriptor&) -> FileDescriptor& = delete;

  auto get() const -> int { return fd_; }

  auto reset() -> void {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_ = -1;
};

struct Pipe {
  FileDescriptor read;
  FileDescriptor write;
};

auto make_pipe() -> Expected<Pipe> {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    return tl::unexpected(make_error(ErrorCode::IOFailure, errno_message("pipe2", errno)));
  }
  return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

/// posix_spawn attribute and file-action objects with paired destroy calls.
struct SpawnSetup {
  posix_spawnattr_t attr{};
  posix_spawn_file_actions_t actions{};
  bool attr_ready = false;
  bool actions_ready = false;

  ~SpawnSetup() {
    if (actions_ready) {
      posix_spawn_file_actions_destroy(&actions);
    }
    if (attr_ready) {
      posix_spawnattr_destroy(&attr);
    }
  }

  auto init(int stdout_fd, int stderr_fd) -> int {
    int rc = posix_spawnattr_init(&attr);
    if (rc != 0) {
      return rc;
    }
    attr_ready = true;
    rc = posix_spawn_file_actions_init(&actions);
    if (rc != 0) {
      return rc;
    }
    actions_ready = true;

    sigset_t mask;
    sigemptyset(&mask);
    sigset_t defaults;
    sigemptyset(&defaults);
    for (int sig : {SIGPIPE, SIGINT, SIGTERM, SIGHUP, SIGQUIT, SIGCHLD}) {
      sigaddset(&defaults, sig);
    }
    short flags = POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF;
    if ((rc = posix_spawnattr_setflags(&attr, flags)) != 0 ||
        (rc = posix_spawnattr_setpgroup(&attr, 0)) != 0 ||
        (rc = posix_spawnattr_setsigmask(&attr, &mask)) != 0 ||
        (rc = posix_spawnattr_setsigdefault(&attr, &defaults)) != 0) {
      return rc;
    }

    if ((rc = posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0)) != 0 ||
        (rc = posix_spawn_file_actions_adddup2(&actions, stdout_fd, STDOUT_FILENO)) != 0 ||
        (rc = posix_spawn_file_actions_adddup2(&actions, stderr_fd, STDERR_FILENO)) != 0) {
      return rc;
    }
    return 0;
  }
};

}  // namespace

auto ProcessSandbox::create(ProcessSandboxConfig config) -> Expected<std::shared_ptr<ProcessSandbox>> {
  std::error_code ec;
  std::filesystem::path root = config.scratch_root;
  if (root.empty()) {
    root = std::filesystem::temp_directory_path(ec);
    if (ec) {
      return tl::unexpected(
        make_error(ErrorCode::Internal, std::format("no temp directory: {}", ec.message())));
    }
  }
  std::filesystem::create_directories(root, ec);
  if (ec) {
    return tl::unexpected(make_error(
      ErrorCode::Internal, std::format("cannot create sandbox root {}: {}", root.string(), ec.message())));
  }

  std::string pattern = (root / "srunner-XXXXXX").string();
  if (::mkdtemp(pattern.data()) == nullptr) {
    return tl::unexpected(make_error(ErrorCode::Internal, errno_message("mkdtemp", errno)));
  }
  return std::shared_ptr<ProcessSandbox>(new ProcessSandbox(std::move(config), pattern));
}

ProcessSandbox::ProcessSandbox(ProcessSandboxConfig config, std::filesystem::path scratch_dir)
    : config_(std::move(config)), scratch_dir_(std::move(scratch_dir)) {}

ProcessSandbox::~ProcessSandbox() { close(true); }

auto ProcessSandbox::evaluate(std::string_view source, std::stop_token stop) -> Expected<void> {
  Expected<std::filesystem::path> script;
  {
    // The script is written under the lock so that close() cannot remove the
    // scratch directory halfway through.
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return tl::unexpected(make_error(ErrorCode::Interrupted, "sandbox is closed"));
    }
    if (started_) {
      return tl::unexpected(make_error(ErrorCode::Internal, "sandbox already used"));
    }
    started_ = true;
    script = write_script(source);
  }
  if (!script) {
    return tl::unexpected(script.error());
  }
  auto out = make_pipe();
  if (!out) {
    return tl::unexpected(out.error());
  }
  auto err = make_pipe();
  if (!err) {
    return tl::unexpected(err.error());
  }

  std::stop_callback on_stop(stop, [this] { interrupt(); });
  if (auto spawned = spawn(*script, out->write.get(), err->write.get()); !spawned) {
    return tl::unexpected(spawned.error());
  }
  out->write.reset();
  err->write.reset();

  const int status = drain(out->read.get(), err->read.get());

  if (interrupted_.load(std::memory_order_acquire)) {
    return tl::unexpected(make_error(ErrorCode::Interrupted, "script execution interrupted"));
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
    return tl::unexpected(make_error(ErrorCode::EvaluationFailure,
                                     std::format("script exited with status {}", WEXITSTATUS(status))));
  }
  if (WIFSIGNALED(status)) {
    return tl::unexpected(make_error(ErrorCode::EvaluationFailure,
                                     std::format("script terminated by signal {}", WTERMSIG(status))));
  }
  return {};
}

auto ProcessSandbox::close(bool force) -> void {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    if (force && pid_ > 0 && !reaped_) {
      interrupted_.store(true, std::memory_order_release);
      ::kill(-pid_, SIGKILL);
    }
  }
  std::error_code ec;
  std::filesystem::remove_all(scratch_dir_, ec);
  if (ec) {
    srunner::log::warn("failed to remove sandbox directory {}: {}", scratch_dir_.string(), ec.message());
  }
}

auto ProcessSandbox::write_script(std::string_view source) -> Expected<std::filesystem::path> {
  auto path = scratch_dir_ / config_.script_name;
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    return tl::unexpected(
      make_error(ErrorCode::IOFailure, std::format("cannot write script file {}", path.string())));
  }
  file.write(source.data(), static_cast<std::streamsize>(source.size()));
  file.close();
  if (!file) {
    return tl::unexpected(
      make_error(ErrorCode::IOFailure, std::format("cannot write script file {}", path.string())));
  }
  return path;
}

auto ProcessSandbox::spawn(const std::filesystem::path& script, int stdout_fd, int stderr_fd)
  -> Expected<void> {
  SpawnSetup setup;
  if (int rc = setup.init(stdout_fd, stderr_fd); rc != 0) {
    return tl::unexpected(make_error(ErrorCode::Internal, errno_message("posix_spawn setup", rc)));
  }

  std::vector<std::string> args;
  args.reserve(config_.interpreter_args.size() + 2);
  args.push_back(config_.interpreter);
  args.insert(args.end(), config_.interpreter_args.begin(), config_.interpreter_args.end());
  args.push_back(script.string());
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || interrupted_.load(std::memory_order_acquire)) {
    interrupted_.store(true, std::memory_order_release);
    return tl::unexpected(make_error(ErrorCode::Interrupted, "script execution interrupted"));
  }
  pid_t child = -1;
  int rc = posix_spawnp(&child, config_.interpreter.c_str(), &setup.actions, &setup.attr, argv.data(), environ);
  if (rc != 0) {
    return tl::unexpected(make_error(
      ErrorCode::EvaluationFailure, errno_message(std::format("cannot start {}", config_.interpreter), rc)));
  }
  pid_ = child;
  srunner::log::debug("sandbox started pid={} dir={}", child, scratch_dir_.string());
  return {};
}

auto ProcessSandbox::drain(int stdout_fd, int stderr_fd) -> int {
  std::array<pollfd, 2> fds{{{stdout_fd, POLLIN, 0}, {stderr_fd, POLLIN, 0}}};
  std::array<OutputBuffer*, 2> buffers{&stdout_, &stderr_};
  constexpr std::array<std::string_view, 2> kNames{"read stdout", "read stderr"};
  std::array<char, kReadChunk> chunk{};

  int status = 0;
  bool reaped = false;
  bool broken = false;
  while (fds[0].fd >= 0 || fds[1].fd >= 0) {
    int ready = ::poll(fds.data(), fds.size(), reaped ? 0 : kPollTimeoutMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      auto error = make_error(ErrorCode::IOFailure, errno_message("poll", errno));
      for (std::size_t i = 0; i < fds.size(); ++i) {
        if (fds[i].fd >= 0) {
          buffers[i]->fail(error);
          fds[i].fd = -1;
        }
      }
      broken = true;
      break;
    }
    if (ready == 0) {
      if (reaped) {
        // The interpreter exited but something it started still holds a pipe.
        break;
      }
      reaped = try_reap(status, false);
      continue;
    }
    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      ssize_t count = ::read(fds[i].fd, chunk.data(), chunk.size());
      if (count > 0) {
        buffers[i]->append(std::string_view(chunk.data(), static_cast<std::size_t>(count)));
      } else if (count == 0) {
        fds[i].fd = -1;
      } else if (errno != EINTR && errno != EAGAIN) {
        buffers[i]->fail(make_error(ErrorCode::IOFailure, errno_message(kNames[i], errno)));
        fds[i].fd = -1;
        broken = true;
      }
    }
  }

  // Open pipes mean members of the process group are still alive, so the
  // group id cannot have been recycled even if the interpreter was reaped.
  const bool leftovers = fds[0].fd >= 0 || fds[1].fd >= 0;
  if (broken || leftovers) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0) {
      ::kill(-pid_, SIGKILL);
    }
  }
  if (!reaped) {
    try_reap(status, true);
  }
  return status;
}

auto ProcessSandbox::try_reap(int& status, bool block) -> bool {
  pid_t pid = -1;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) {
      return true;
    }
    pid = pid_;
  }
  if (pid <= 0) {
    return true;
  }
  if (block) {
    // Wait for exit without reaping so the pid stays reserved until the lock
    // below is held.
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) == -1 && errno == EINTR) {
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (;;) {
    pid_t result = ::waitpid(pid, &status, WNOHANG);
    if (result == pid) {
      reaped_ = true;
      return true;
    }
    if (result == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    srunner::log::warn("waitpid failed for pid={}: {}", pid, std::generic_category().message(errno));
    status = 0;
    reaped_ = true;
    return true;
  }
}

auto ProcessSandbox::interrupt() -> void {
  interrupted_.store(true, std::memory_order_release);
  std::lock_guard<std::mutex> lock(mutex_);
  if (pid_ > 0 && !reaped_) {
    ::kill(-pid_, SIGKILL);
  }
}

auto make_process_sandbox_factory(ProcessSandboxConfig config) -> SandboxFactory {
  return [config = std::move(config)]() -> Expected<std::shared_ptr<Sandbox>> {
    auto sandbox = ProcessSandbox::create(config);
    if (!sandbox) {
      return tl::unexpected(sandbox.error());
    }
    return std::shared_ptr<Sandbox>(std::move(*sandbox));
  };
}

}  // namespace srunner::engine
