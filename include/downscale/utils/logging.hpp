#pragma once

#ifndef DOWNSCALE_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace downscale::utils {

/**
 * @class Logging
 * @brief Process-wide access point to the spdlog logger used by the library.
 *
 * Every model and grouping helper logs through the same named logger, so an
 * application can raise or lower verbosity for the whole library at once.
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger, creating it on first use.
	 *
	 * Safe to call from several threads at once.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Sets the level of the shared logger.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace downscale::utils

#define DOWNSCALE_TRACE(...)    downscale::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define DOWNSCALE_DEBUG(...)    downscale::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define DOWNSCALE_INFO(...)     downscale::utils::Logging::getLogger()->info(__VA_ARGS__)
#define DOWNSCALE_WARN(...)     downscale::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define DOWNSCALE_ERROR(...)    downscale::utils::Logging::getLogger()->error(__VA_ARGS__)
#define DOWNSCALE_CRITICAL(...) downscale::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else

namespace downscale::utils {

class Logging {
public:
	static void init() {}
};

} // namespace downscale::utils

#define DOWNSCALE_TRACE(...)    do {} while(0)
#define DOWNSCALE_DEBUG(...)    do {} while(0)
#define DOWNSCALE_INFO(...)     do {} while(0)
#define DOWNSCALE_WARN(...)     do {} while(0)
#define DOWNSCALE_ERROR(...)    do {} while(0)
#define DOWNSCALE_CRITICAL(...) do {} while(0)

#endif // DOWNSCALE_NO_LOGGING
