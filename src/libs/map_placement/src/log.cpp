#include <map_placement/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace map_placement {

namespace {

std::shared_ptr<spdlog::logger> make_placement_logger() {
    try {
        auto logger = spdlog::get("map_placement");
        if (!logger) logger = spdlog::stderr_color_mt("map_placement");
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
        return logger;
    } catch (const spdlog::spdlog_ex&) {
        return spdlog::default_logger();
    }
}

} // namespace

std::shared_ptr<spdlog::logger> placement_logger() {
    // Function-local static: initialized exactly once, even across threads.
    static const std::shared_ptr<spdlog::logger> logger = make_placement_logger();
    return logger;
}

} // namespace map_placement
