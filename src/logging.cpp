#include "dsfetch/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace dsfetch {

void setupLogging(const LogOptions& options) {
    auto logger = spdlog::stderr_color_mt("dsfetch");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (options.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

} // namespace dsfetch
