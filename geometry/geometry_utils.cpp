#include "geometry_utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace panelroute {

namespace {

// floor() of a local coordinate, saturated to the int range. NaN maps to the
// lowest int so that it lands outside every grid.
int floor_to_cell(double local) {
    double cell = std::floor(local);
    if (!(cell >= static_cast<double>(std::numeric_limits<int>::min()))) {
        return std::numeric_limits<int>::min();
    }
    if (cell > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(cell);
}

}  // namespace

bool boxes_intersect(const Aabb& a, const Aabb& b) {
    return a.min.x < b.max.x && a.max.x > b.min.x &&
           a.min.y < b.max.y && a.max.y > b.min.y &&
           a.min.z < b.max.z && a.max.z > b.min.z;
}

bool point_in_box(const Vec3& point, const Aabb& box) {
    return point.x >= box.min.x && point.x <= box.max.x &&
           point.y >= box.min.y && point.y <= box.max.y &&
           point.z >= box.min.z && point.z <= box.max.z;
}

GridCoord world_to_grid(const Vec3& point, float resolution, const Vec3& origin) {
    Vec3 local = (point - origin) / resolution;
    return {
        floor_to_cell(local.x),
        floor_to_cell(local.y),
        floor_to_cell(local.z)
    };
}

Vec3 grid_to_world(const GridCoord& coord, float resolution, const Vec3& origin) {
    return {
        origin.x + (static_cast<float>(coord.x) + 0.5f) * resolution,
        origin.y + (static_cast<float>(coord.y) + 0.5f) * resolution,
        origin.z + (static_cast<float>(coord.z) + 0.5f) * resolution
    };
}

std::optional<RailSnap> quantize_to_rail(const Vec3& position,
                                         const MountingRail& rail,
                                         float module_width,
                                         float snap_tolerance) {
    if (module_width <= 0.0f) {
        return std::nullopt;
    }

    const size_t along = rail.along_axis();
    Vec3 offset = position - rail.position;

    for (size_t axis = 0; axis < 3; ++axis) {
        if (axis == along) continue;
        if (!(std::abs(offset[axis]) <= snap_tolerance)) {
            return std::nullopt;
        }
    }

    float modules = offset[along] / module_width;
    if (std::isnan(modules)) {
        return std::nullopt;
    }
    long last_slot = rail.max_modules > 0 ? static_cast<long>(rail.max_modules) - 1 : 0;
    long slot = std::lround(std::clamp(modules, 0.0f, static_cast<float>(last_slot)));

    RailSnap snap;
    snap.slot = static_cast<uint32_t>(slot);
    snap.position = rail.position;
    snap.position[along] += static_cast<float>(slot) * module_width;
    return snap;
}

}  // namespace panelroute
