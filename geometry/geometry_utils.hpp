#ifndef PANELROUTE_GEOMETRY_UTILS_HPP
#define PANELROUTE_GEOMETRY_UTILS_HPP

#include "aabb.hpp"
#include <math/vec3.hpp>
#include <panel/mounting_rail.hpp>
#include <cstdint>
#include <optional>

namespace panelroute {

// Integer cell coordinates in an occupancy grid
struct GridCoord {
    int x = 0;
    int y = 0;
    int z = 0;

    constexpr bool operator==(const GridCoord& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr GridCoord operator+(const GridCoord& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr GridCoord operator-(const GridCoord& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }
};

// Overlap on all three axes. Boxes that only share a face do not intersect.
bool boxes_intersect(const Aabb& a, const Aabb& b);

// Inclusive containment
bool point_in_box(const Vec3& point, const Aabb& box);

// floor((point - origin) / resolution) per axis, saturated to the int range
// so far-away points map to coordinates outside any grid
GridCoord world_to_grid(const Vec3& point, float resolution, const Vec3& origin);

// Center of the cell; world_to_grid(grid_to_world(c)) == c
Vec3 grid_to_world(const GridCoord& coord, float resolution, const Vec3& origin);

// A position quantized onto a rail
struct RailSnap {
    Vec3 position;
    uint32_t slot = 0;
};

// Snap a position onto a rail. Returns nullopt when the position is farther
// than snap_tolerance from the rail line on either perpendicular axis.
// Otherwise the along-rail offset is rounded to the nearest module and the
// slot is clamped to [0, max_modules - 1].
std::optional<RailSnap> quantize_to_rail(const Vec3& position,
                                         const MountingRail& rail,
                                         float module_width,
                                         float snap_tolerance);

}  // namespace panelroute

#endif // PANELROUTE_GEOMETRY_UTILS_HPP
