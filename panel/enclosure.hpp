#ifndef PANELROUTE_PANEL_ENCLOSURE_HPP
#define PANELROUTE_PANEL_ENCLOSURE_HPP

#include "mounting_rail.hpp"
#include <geometry/aabb.hpp>
#include <math/vec3.hpp>
#include <string>
#include <vector>

namespace panelroute {

// The panel volume components are mounted in
struct Enclosure {
    std::string id = "panel-1";
    float width = 0.0f;     // x extent, mm
    float height = 0.0f;    // y extent, mm
    float depth = 0.0f;     // z extent, mm
    Vec3 origin;            // Minimum corner in world space

    std::vector<MountingRail> rails;

    Vec3 size() const {
        return {width, height, depth};
    }

    Aabb bounds() const {
        return Aabb::from_min_size(origin, size());
    }

    // Throws InvalidEnclosure if a dimension is non-positive or a rail
    // (start or end) lies outside the volume.
    void validate() const;

    // 800x600x200 panel centered on x/z with three horizontal DIN rails
    static Enclosure standard_panel();
};

}  // namespace panelroute

#endif // PANELROUTE_PANEL_ENCLOSURE_HPP
