#ifndef PANELROUTE_PANEL_MOUNTING_RAIL_HPP
#define PANELROUTE_PANEL_MOUNTING_RAIL_HPP

#include <math/vec3.hpp>
#include <cstdint>
#include <string>

namespace panelroute {

enum class RailOrientation {
    Horizontal,   // runs along +x from its anchor
    Vertical      // runs along +y from its anchor
};

// DIN rail that components snap onto at fixed module increments
struct MountingRail {
    std::string id;
    Vec3 position;                  // Rail start point
    float length = 0.0f;            // mm
    RailOrientation orientation = RailOrientation::Horizontal;
    uint32_t max_modules = 0;

    // Axis index the rail runs along (0 = x, 1 = y)
    size_t along_axis() const {
        return orientation == RailOrientation::Horizontal ? 0 : 1;
    }

    Vec3 end() const {
        Vec3 e = position;
        e[along_axis()] += length;
        return e;
    }
};

}  // namespace panelroute

#endif // PANELROUTE_PANEL_MOUNTING_RAIL_HPP
