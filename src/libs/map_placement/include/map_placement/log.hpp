#pragma once

#include <spdlog/logger.h>
#include <memory>

namespace map_placement {

// Engine logger ("map_placement", stderr). Falls back to the default logger.
std::shared_ptr<spdlog::logger> placement_logger();

} // namespace map_placement
