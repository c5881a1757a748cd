#include "common/logging/log.hpp"

#include <gflags/gflags.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <mutex>
#include <vector>

DEFINE_string(log_level, "info", "Minimum log level (trace, debug, info, warn, error, critical, off)");
DEFINE_string(log_file, "schema_identity.log", "Rotating log file; empty logs to stderr only");
DEFINE_int32(log_max_size, 10485760, "Bytes per log file before rotation");
DEFINE_int32(log_max_files, 3, "Rotated log files kept");
DEFINE_bool(log_to_stderr, false, "Mirror log records to stderr");

namespace {

std::shared_ptr<spdlog::sinks::sink> create_file_sink(const std::string& file_path,
                                                      size_t max_size,
                                                      int max_files) {
  if (max_files < 1) {
    max_files = 1;
  }
  if (max_size < 1024) {
    max_size = 1024;
  }
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file_path, max_size, max_files);
}

}  // namespace

namespace sid::log {

namespace {
  std::mutex g_mutex;
  std::shared_ptr<spdlog::async_logger> g_logger;
}

auto parse_level(std::string_view level) -> spdlog::level::level_enum {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn") return spdlog::level::warn;
  if (level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void init() {
  std::lock_guard lock(g_mutex);
  if (g_logger) {
    return;
  }

  const std::string log_file = FLAGS_log_file;
  const auto level = parse_level(FLAGS_log_level);

  std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;
  if (!log_file.empty()) {
    sinks.push_back(create_file_sink(log_file, static_cast<size_t>(FLAGS_log_max_size),
                                     FLAGS_log_max_files));
  }
  if (FLAGS_log_to_stderr || sinks.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  for (auto& sink : sinks) {
    sink->set_level(level);
  }

  spdlog::init_thread_pool(8192, 1);
  g_logger = std::make_shared<spdlog::async_logger>(
      "schema_identity", sinks.begin(), sinks.end(), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(g_logger);
  spdlog::set_level(level);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

  spdlog::info("Logger initialized: file={}, level={}, stderr={}", log_file, FLAGS_log_level,
               FLAGS_log_to_stderr);
}

void shutdown() {
  std::lock_guard lock(g_mutex);
  if (g_logger) {
    g_logger->flush();
    spdlog::shutdown();
    g_logger.reset();
  }
}

void info(std::string_view event, const std::unordered_map<std::string, std::string>& fields) {
  std::string msg{event};
  for (const auto& [key, value] : fields) {
    msg += " " + key + "=" + value;
  }
  spdlog::info(msg);
}

}  // namespace sid::log
