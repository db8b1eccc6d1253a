#ifndef PANELROUTE_PANEL_COMPONENT_INSTANCE_HPP
#define PANELROUTE_PANEL_COMPONENT_INSTANCE_HPP

#include "component_definition.hpp"
#include <geometry/aabb.hpp>
#include <math/vec3.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace panelroute {

using InstanceId = std::string;

// World-space realization of a logical pin
struct PhysicalPin {
    std::string name;
    PinType type = PinType::Input;
    Vec3 offset;        // Relative to the instance's physical position
    Vec3 world;         // Always physical_position + offset
};

// A placed (or not yet placed) occurrence of a component definition
struct ComponentInstance {
    InstanceId id;
    std::string definition_id;
    std::string label;
    Vec3 size;                          // Copied from the definition

    Vec2 schematic_position;
    Vec3 physical_position;             // Minimum corner of the body
    bool physically_placed = false;

    std::optional<uint32_t> rail_slot;
    std::optional<std::string> rail_id;

    std::vector<PhysicalPin> pins;

    // Build an unplaced instance at the world origin
    static ComponentInstance create(const InstanceId& id,
                                    const ComponentDefinition& definition,
                                    const std::string& label,
                                    const Vec2& schematic_position);

    // Move the body and recompute every pin's world position
    void move_to(const Vec3& position);

    // Re-derive pin world positions from the current physical position
    void recompute_pins();

    const PhysicalPin* find_pin(const std::string& name) const;

    Aabb body() const {
        return Aabb::from_min_size(physical_position, size);
    }

    Aabb footprint(float clearance) const {
        return body().padded(clearance);
    }
};

}  // namespace panelroute

#endif // PANELROUTE_PANEL_COMPONENT_INSTANCE_HPP
