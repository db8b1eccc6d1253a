#include "placement_service.hpp"

namespace panelroute {

CollisionResult PlacementService::find_collisions(const ComponentInstance& candidate,
                                                  const std::vector<ComponentInstance>& others,
                                                  float clearance) {
    CollisionResult result;
    if (!candidate.physically_placed) {
        return result;
    }

    Aabb box = candidate.footprint(clearance);
    for (const auto& other : others) {
        if (other.id == candidate.id || !other.physically_placed) continue;
        if (boxes_intersect(box, other.footprint(clearance))) {
            result.has_collision = true;
            result.colliding_with.push_back(other.id);
        }
    }
    return result;
}

bool PlacementService::check_collision(const ComponentInstance& candidate,
                                       const std::vector<ComponentInstance>& others,
                                       float clearance) {
    return find_collisions(candidate, others, clearance).has_collision;
}

std::optional<SnapResult> PlacementService::snap_to_nearest_rail(
        const Vec3& position,
        const std::vector<MountingRail>& rails,
        float module_width,
        float tolerance) {
    for (const auto& rail : rails) {
        auto snap = quantize_to_rail(position, rail, module_width, tolerance);
        if (snap) {
            return SnapResult{snap->position, rail.id, snap->slot};
        }
    }
    return std::nullopt;
}

}  // namespace panelroute
