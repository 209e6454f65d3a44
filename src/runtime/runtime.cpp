#include "runtime/runtime.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"

DECLARE_int32(worker_threads);
DECLARE_int32(output_poll_interval_ms);
DECLARE_int32(sweep_interval_seconds);
DECLARE_int32(dispatch_keep_alive_seconds);
DECLARE_string(interpreter);
DECLARE_string(interpreter_args);
DECLARE_string(sandbox_root);

namespace srunner::runtime {
namespace {

auto split_args(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> args;
  while (!text.empty()) {
    auto comma = text.find(',');
    auto piece = text.substr(0, comma);
    if (!piece.empty()) {
      args.emplace_back(piece);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    text.remove_prefix(comma + 1);
  }
  return args;
}

}  // namespace

auto runtime_config_from_flags() -> RuntimeConfig {
  RuntimeConfig config;
  config.worker_threads = static_cast<std::size_t>(std::max(1, FLAGS_worker_threads));
  config.output_poll_interval = std::chrono::milliseconds(std::max(1, FLAGS_output_poll_interval_ms));
  config.sweep_interval = std::chrono::seconds(std::max(1, FLAGS_sweep_interval_seconds));
  config.dispatch_keep_alive = std::chrono::seconds(std::max(1, FLAGS_dispatch_keep_alive_seconds));
  config.sandbox.interpreter = FLAGS_interpreter;
  config.sandbox.interpreter_args = split_args(FLAGS_interpreter_args);
  config.sandbox.scratch_root = FLAGS_sandbox_root;
  return config;
}

Runtime::Runtime(RuntimeConfig config) {
  srunner::log::init();

  engine::SandboxFactory factory = std::move(config.sandbox_factory);
  if (!factory) {
    factory = engine::make_process_sandbox_factory(config.sandbox);
    srunner::log::info("Scripts run with interpreter '{}'", config.sandbox.interpreter);
  }

  evaluation_pool_ = std::make_unique<EvaluationPool>(config.worker_threads);
  lifecycle_ = std::make_unique<LifecycleEngine>(
    registry_, *evaluation_pool_, std::move(factory),
    LifecycleConfig{.output_poll_interval = config.output_poll_interval});
  dispatch_pool_ = std::make_unique<DispatchPool>(config.dispatch_keep_alive);
  coordinator_ = std::make_unique<ExecutionCoordinator>(registry_, *lifecycle_, *dispatch_pool_);
  sweeper_ = std::make_unique<CleanupSweeper>(registry_, config.sweep_interval,
                                              config.first_sweep_delay);
}

Runtime::~Runtime() {
  sweeper_.reset();
  evaluation_pool_->shutdown();
  // Lifecycle runs on the dispatch threads observe the cancellations and
  // return; only then may the lifecycle engine and the pools go away.
  dispatch_pool_.reset();
  coordinator_.reset();
  lifecycle_.reset();
  evaluation_pool_.reset();
}

}  // namespace srunner::runtime
