#pragma once

#include <map_model/types.hpp>
#include <string>
#include <vector>

namespace map_model {

// Fixed mark drawn at its anchor (city dot, icon). Never moves.
struct Fixture {
    std::string id;
    Point center;
    Size size;
    std::string group;
};

struct CampaignPath {
    std::string id;
    std::vector<Point> points;
    std::string style; // e.g. "invasion", "retreat"
};

struct MapScene {
    std::string name;
    double canvas_width = 0;
    double canvas_height = 0;
    std::vector<Element> elements;
    std::vector<Fixture> fixtures;
    std::vector<CampaignPath> campaigns;
};

} // namespace map_model
