#include "tide-check/utils/logging.hpp"

#ifndef TIDECHECK_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tidecheck::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("tide-check");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("tide-check");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace tidecheck::utils

#endif // TIDECHECK_NO_LOGGING
