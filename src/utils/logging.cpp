#include "downscale/utils/logging.hpp"

#ifndef DOWNSCALE_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace downscale::utils {

namespace {

std::once_flag logger_once;

} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	getLogger()->set_level(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	// Models fitted on separate threads share this logger, so it is created once.
	std::call_once(logger_once, [] {
		logger_ = spdlog::get("downscale");
		if (!logger_) {
			logger_ = spdlog::stderr_color_mt("downscale");
			logger_->set_level(spdlog::level::info);
		}
		logger_->flush_on(spdlog::level::warn);
	});
	return logger_;
}

} // namespace downscale::utils

#endif // DOWNSCALE_NO_LOGGING
