#include "SaftLogging.hpp"

#include <cstdlib>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace saft {

std::shared_ptr<spdlog::logger> Logger() {
	static std::once_flag once;
	std::call_once(once, [] {
		if (spdlog::get(LOGGER_NAME)) {
			return;
		}
		auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
		logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
		logger->set_level(spdlog::level::warn);
		if (const char *env = std::getenv("SAFT_LOG_LEVEL")) {
			logger->set_level(spdlog::level::from_str(env));
		}
	});
	auto logger = spdlog::get(LOGGER_NAME);
	if (!logger) {
		// dropped by the host after initialization
		logger = spdlog::stderr_color_mt(LOGGER_NAME);
	}
	return logger;
}

void SetLogLevel(const std::string &level) {
	Logger()->set_level(spdlog::level::from_str(level));
}

} // namespace saft
