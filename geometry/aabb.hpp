#ifndef PANELROUTE_GEOMETRY_AABB_HPP
#define PANELROUTE_GEOMETRY_AABB_HPP

#include <math/vec3.hpp>

namespace panelroute {

// Axis-aligned bounding box, min <= max on every axis
struct Aabb {
    Vec3 min;
    Vec3 max;

    static Aabb from_min_size(const Vec3& corner, const Vec3& size) {
        return Aabb{corner, corner + size};
    }

    // Grown by margin on every side
    Aabb padded(float margin) const {
        Vec3 m(margin, margin, margin);
        return Aabb{min - m, max + m};
    }

    Vec3 size() const {
        return max - min;
    }
};

}  // namespace panelroute

#endif // PANELROUTE_GEOMETRY_AABB_HPP
