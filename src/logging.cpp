#include "dataswap/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace dataswap {

void setup_logging(const LogConfig& config) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("dataswap", console_sink);

    logger->set_level(spdlog::level::from_str(config.level));

    spdlog::set_default_logger(logger);
    if (config.pattern.empty()) {
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    } else {
        spdlog::set_pattern(config.pattern);
    }
}

std::string describe(const Pool& pool) {
    return "pool " + pool.key.id() +
           " reserve_a=" + x18::to_string(pool.reserve_a) +
           " reserve_b=" + x18::to_string(pool.reserve_b) +
           " total_units=" + x18::to_string(pool.total_units) +
           " version=" + std::to_string(pool.version);
}

} // namespace dataswap
