#pragma once

#include <map_placement/layout_result.hpp>
#include <map_placement/log.hpp>
#include <map_placement/types.hpp>
#include <string>
#include <vector>

namespace map_placement {

struct OverlapPair {
    std::string first;
    std::string second;
    double area = 0;
};

// Pairwise check of every visible placement against the others and against
// `obstacles`, with both boxes grown by `padding`. Touching counts; boxes
// sharing a non-empty group are skipped.
// Pairs come out in input order; obstacle pairs name the obstacle second.
std::vector<OverlapPair> detect_overlaps(const LayoutResult& result,
    const std::vector<Obstacle>& obstacles = {}, double padding = 0.0);

// Writes one warn line per pair to `logger`. Returns the pair count.
std::size_t log_overlaps(const std::vector<OverlapPair>& pairs,
    const std::shared_ptr<spdlog::logger>& logger = placement_logger());

} // namespace map_placement
