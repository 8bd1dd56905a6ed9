#ifndef SCENELINK_LOG_H
#define SCENELINK_LOG_H

#include <memory>

#include <spdlog/spdlog.h>

namespace scenelink {
namespace log {

constexpr const char* kLoggerName = "scenelink";

/**
 * @brief Create (or reconfigure) the shared "scenelink" logger.
 *
 * Installs a colour stdout sink and routes ETL runtime errors to the same
 * logger. Safe to call more than once; later calls only change the level.
 */
void init(spdlog::level::level_enum level = spdlog::level::info);

// Returns the shared logger, creating it with defaults on first use.
std::shared_ptr<spdlog::logger> get();

}  // namespace log
}  // namespace scenelink

#endif  // SCENELINK_LOG_H
