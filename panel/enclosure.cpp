#include "enclosure.hpp"
#include <common/errors.hpp>
#include <geometry/geometry_utils.hpp>

namespace panelroute {

void Enclosure::validate() const {
    if (!(width > 0.0f) || !(height > 0.0f) || !(depth > 0.0f)) {
        throw InvalidEnclosure("dimensions must be positive");
    }

    Aabb box = bounds();
    for (const auto& rail : rails) {
        if (!point_in_box(rail.position, box) || !point_in_box(rail.end(), box)) {
            throw InvalidEnclosure("rail '" + rail.id + "' lies outside the enclosure");
        }
    }
}

Enclosure Enclosure::standard_panel() {
    Enclosure panel;
    panel.id = "panel-1";
    panel.width = 800.0f;
    panel.height = 600.0f;
    panel.depth = 200.0f;
    panel.origin = Vec3(-400.0f, 0.0f, -100.0f);

    const float rail_heights[] = {200.0f, 100.0f, 0.0f};
    int index = 1;
    for (float y : rail_heights) {
        MountingRail rail;
        rail.id = "dinrail-" + std::to_string(index++);
        rail.position = Vec3(-350.0f, y, -50.0f);
        rail.length = 700.0f;
        rail.orientation = RailOrientation::Horizontal;
        rail.max_modules = 40;
        panel.rails.push_back(rail);
    }
    return panel;
}

}  // namespace panelroute
