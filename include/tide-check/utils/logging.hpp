#pragma once

#ifndef TIDECHECK_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace tidecheck::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * A single logger instance is shared by every pipeline stage and can be
 * configured once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tidecheck::utils

// --- Logger Macros for convenient access ---
#define TIDECHECK_TRACE(...)    tidecheck::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define TIDECHECK_DEBUG(...)    tidecheck::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define TIDECHECK_INFO(...)     tidecheck::utils::Logging::getLogger()->info(__VA_ARGS__)
#define TIDECHECK_WARN(...)     tidecheck::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define TIDECHECK_ERROR(...)    tidecheck::utils::Logging::getLogger()->error(__VA_ARGS__)
#define TIDECHECK_CRITICAL(...) tidecheck::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when spdlog is not available

namespace tidecheck::utils {

class Logging {
public:
	static void init() {}
};

} // namespace tidecheck::utils

#define TIDECHECK_TRACE(...)    do {} while(0)
#define TIDECHECK_DEBUG(...)    do {} while(0)
#define TIDECHECK_INFO(...)     do {} while(0)
#define TIDECHECK_WARN(...)     do {} while(0)
#define TIDECHECK_ERROR(...)    do {} while(0)
#define TIDECHECK_CRITICAL(...) do {} while(0)

#endif // TIDECHECK_NO_LOGGING
