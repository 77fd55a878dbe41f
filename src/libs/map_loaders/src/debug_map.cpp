#include <map_loaders/debug_map.hpp>
#include <map_placement/placement_constants.hpp>
#include <initializer_list>

namespace map_loaders {

namespace {

namespace defaults = map_placement::defaults;

const double city_dot_size[4] = { 6.0, 5.0, 4.0, 3.0 };

} // namespace

map_model::MapScene generate_debug_map(const map_placement::FootprintEstimator& estimator) {
    map_model::MapScene out;
    out.name = "Ulm-Austerlitz campaign 1805 (debug)";
    out.canvas_width = 1200;
    out.canvas_height = 700;

    auto text_size = [&](const std::string& text, double font_size) {
        map_placement::TextStyle style;
        style.font_size = font_size;
        return estimator.measure(text, style);
    };
    auto add_city = [&](const char* id, const char* name, double x, double y, int level) {
        const std::string group = std::string("city:") + id;
        map_model::Element label;
        label.id = id;
        label.text = name;
        label.anchor = map_model::PointLabel{ { x, y }, level };
        label.priority = defaults::city_label_priority(level);
        label.footprint = text_size(name, defaults::city_font(level));
        label.group = group;
        out.elements.push_back(std::move(label));

        const double dot = city_dot_size[defaults::clamp_city_level(level) - 1];
        out.fixtures.push_back(map_model::Fixture{ std::string("dot:") + id, { x, y }, { dot, dot }, group });
    };
    auto add_arrowhead = [&](const char* id, const char* city_id, double x, double y) {
        map_model::Element head;
        head.id = id;
        head.anchor = map_model::ArrowEndpoint{ { x, y }, city_id };
        head.priority = defaults::priority::arrow_endpoint;
        head.footprint = { defaults::arrowhead_size, defaults::arrowhead_size };
        head.group = std::string("city:") + city_id;
        out.elements.push_back(std::move(head));
    };
    auto add_path_label = [&](const char* id, const char* name, std::initializer_list<map_model::Point> path,
        map_model::PathRole role, int priority, double font_size)
    {
        map_model::Element label;
        label.id = id;
        label.text = name;
        label.anchor = map_model::PathLabel{ std::vector<map_model::Point>(path), role };
        label.priority = priority;
        label.footprint = text_size(name, font_size);
        out.elements.push_back(std::move(label));
    };
    auto add_event = [&](const char* id, const char* name, const char* date, double x, double y) {
        map_placement::TextStyle style;
        style.font_size = defaults::event_font_size;
        map_placement::TextStyle sub_style;
        sub_style.font_size = defaults::event_subtext_font_size;

        map_model::Element event;
        event.id = id;
        event.text = name;
        event.anchor = map_model::EventMarker{ { x, y } };
        event.priority = defaults::priority::event_marker;
        event.footprint = map_placement::measure_block(estimator, name, style, date, sub_style);
        out.elements.push_back(std::move(event));
    };

    add_city("paris", "Paris", 180, 420, 1);
    add_city("strasbourg", "Strasbourg", 470, 390, 2);
    add_city("metz", "Metz", 420, 360, 3);
    add_city("mainz", "Mainz", 500, 300, 2);
    add_city("frankfurt", "Frankfurt", 540, 275, 2);
    add_city("stuttgart", "Stuttgart", 540, 400, 3);
    add_city("ulm", "Ulm", 600, 430, 2);
    add_city("munich", "Munich", 690, 470, 2);
    add_city("berlin", "Berlin", 820, 140, 1);
    add_city("dresden", "Dresden", 830, 260, 2);
    add_city("vienna", "Vienna", 930, 455, 1);
    add_city("brno", "Brno", 900, 395, 3);
    add_city("austerlitz", "Austerlitz", 915, 410, 4);
    add_city("pressburg", "Pressburg", 975, 465, 4);

    // Grande Armee advance: Paris -> Strasbourg -> Ulm -> Vienna -> Austerlitz.
    out.campaigns.push_back(map_model::CampaignPath{ "grande_armee",
        { { 180, 420 }, { 470, 390 }, { 600, 430 }, { 930, 455 }, { 915, 410 } }, "invasion" });
    out.campaigns.push_back(map_model::CampaignPath{ "russian_retreat",
        { { 915, 410 }, { 960, 360 }, { 1040, 300 } }, "retreat" });

    add_arrowhead("arrow_ulm", "ulm", 600, 430);
    add_arrowhead("arrow_vienna", "vienna", 930, 455);
    add_arrowhead("arrow_austerlitz", "austerlitz", 915, 410);

    add_path_label("danube", "Danube",
        { { 560, 445 }, { 640, 440 }, { 720, 452 }, { 800, 448 }, { 900, 468 }, { 1000, 480 } },
        map_model::PathRole::River, defaults::priority::river, defaults::river_font_size);
    add_path_label("rhine", "Rhine",
        { { 480, 560 }, { 490, 450 }, { 500, 340 }, { 520, 290 }, { 470, 190 } },
        map_model::PathRole::River, defaults::priority::river, defaults::river_font_size);
    add_path_label("bavaria", "BAVARIA", { { 620, 520 }, { 780, 520 } },
        map_model::PathRole::Region, defaults::priority::region, defaults::region_font_size);

    add_event("battle_ulm", "Battle of Ulm", "20 Oct 1805", 600, 430);
    add_event("battle_austerlitz", "Battle of Austerlitz", "2 Dec 1805", 915, 410);

    return out;
}

} // namespace map_loaders
