#include "common/logging/log.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <vector>

#include <gflags/gflags.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

DECLARE_string(log_level);
DECLARE_string(log_file);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);
DECLARE_int32(log_queue_size);
DECLARE_string(log_pattern);

namespace srunner::log {
namespace {

constexpr std::size_t kMinRotateBytes = 1024;
constexpr std::size_t kMinQueueSize = 128;

std::mutex g_mutex;
std::shared_ptr<spdlog::async_logger> g_logger;

auto make_sinks(spdlog::level::level_enum level) -> std::vector<spdlog::sink_ptr> {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  const std::string& path = FLAGS_log_file;
  if (!path.empty()) {
    const auto max_bytes = std::max(static_cast<std::size_t>(std::max(FLAGS_log_max_size, 0)),
                                    kMinRotateBytes);
    const auto max_files = static_cast<std::size_t>(std::max(FLAGS_log_max_files, 1));
    sinks.push_back(
      std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, max_bytes, max_files));
  }
  for (auto& sink : sinks) {
    sink->set_level(level);
  }
  return sinks;
}

}  // namespace

void init() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_logger) {
    return;
  }

  // Unknown names fall back to "off" in spdlog; keep info in that case.
  auto level = spdlog::level::from_str(FLAGS_log_level);
  if (level == spdlog::level::off && FLAGS_log_level != "off") {
    level = spdlog::level::info;
  }

  const auto queue = std::max(static_cast<std::size_t>(std::max(FLAGS_log_queue_size, 0)),
                              kMinQueueSize);
  spdlog::init_thread_pool(queue, 1);
  auto sinks = make_sinks(level);
  g_logger = std::make_shared<spdlog::async_logger>("srunner", sinks.begin(), sinks.end(),
                                                    spdlog::thread_pool(),
                                                    spdlog::async_overflow_policy::block);
  g_logger->set_level(level);
  g_logger->set_pattern(FLAGS_log_pattern);
  spdlog::set_default_logger(g_logger);

  spdlog::info("Logging to {} at level {}",
               FLAGS_log_file.empty() ? std::string("stderr") : FLAGS_log_file,
               spdlog::level::to_string_view(level));
}

void shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_logger) {
    return;
  }
  g_logger->flush();
  g_logger.reset();
  spdlog::shutdown();
}

void info(std::string_view event, const std::map<std::string, std::string>& fields) {
  std::string line(event);
  for (const auto& [key, value] : fields) {
    line.append(" ").append(key).append("=").append(value);
  }
  spdlog::info(line);
}

}  // namespace srunner::log
