/*
 * This file is part of SceneLink.
 * (C) 2025 Ignacio Santolin
 */
#include "util/log.h"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "etl/error_handler.h"

namespace scenelink {
namespace log {

namespace {

std::mutex g_logger_mutex;

void onEtlError(const etl::exception& e) {
  get()->error("etl: {} ({}:{})", e.what(), e.file_name(), e.line_number());
}

etl::error_handler::free_function g_etl_error_callback(onEtlError);

std::shared_ptr<spdlog::logger> createLogger() {
  std::shared_ptr<spdlog::logger> logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
  etl::error_handler::set_callback(g_etl_error_callback);
  return logger;
}

}  // namespace

void init(spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  std::shared_ptr<spdlog::logger> logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = createLogger();
  }
  logger->set_level(level);
}

std::shared_ptr<spdlog::logger> get() {
  std::shared_ptr<spdlog::logger> logger = spdlog::get(kLoggerName);
  if (logger) {
    return logger;
  }
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = createLogger();
  }
  return logger;
}

}  // namespace log
}  // namespace scenelink
