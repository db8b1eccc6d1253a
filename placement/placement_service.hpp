#ifndef PANELROUTE_PLACEMENT_SERVICE_HPP
#define PANELROUTE_PLACEMENT_SERVICE_HPP

#include <geometry/geometry_utils.hpp>
#include <panel/component_instance.hpp>
#include <panel/mounting_rail.hpp>
#include <math/vec3.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace panelroute {

struct PlacementConfig {
    float module_width = 17.5f;     // Standard DIN module
    float snap_tolerance = 30.0f;   // mm from the rail line
    float clearance = 0.0f;         // Padding around bodies for overlap checks
};

struct CollisionResult {
    bool has_collision = false;
    std::vector<InstanceId> colliding_with;
};

struct SnapResult {
    Vec3 position;
    std::string rail_id;
    uint32_t slot = 0;
};

// Overlap detection and rail snapping for proposed placements.
// An unplaced instance never collides, whichever side it is on.
class PlacementService {
public:
    // True if the candidate's padded body overlaps any other placed instance.
    // Instances with the candidate's id are skipped.
    static bool check_collision(const ComponentInstance& candidate,
                                const std::vector<ComponentInstance>& others,
                                float clearance = 0.0f);

    static CollisionResult find_collisions(const ComponentInstance& candidate,
                                           const std::vector<ComponentInstance>& others,
                                           float clearance = 0.0f);

    // First rail (in input order) within tolerance wins, even if a later rail
    // is closer. Callers order rails by preference.
    static std::optional<SnapResult> snap_to_nearest_rail(
        const Vec3& position,
        const std::vector<MountingRail>& rails,
        float module_width,
        float tolerance);
};

}  // namespace panelroute

#endif // PANELROUTE_PLACEMENT_SERVICE_HPP
