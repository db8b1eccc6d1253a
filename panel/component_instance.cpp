#include "component_instance.hpp"
#include <algorithm>

namespace panelroute {

ComponentInstance ComponentInstance::create(const InstanceId& id,
                                            const ComponentDefinition& definition,
                                            const std::string& label,
                                            const Vec2& schematic_position) {
    ComponentInstance instance;
    instance.id = id;
    instance.definition_id = definition.id;
    instance.label = label;
    instance.size = definition.dimensions.size();
    instance.schematic_position = schematic_position;
    instance.physical_position = vec3::zero();
    instance.physically_placed = false;

    instance.pins.reserve(definition.pins.size());
    for (const auto& logical : definition.pins) {
        PhysicalPin pin;
        pin.name = logical.name;
        pin.type = logical.type;
        pin.offset = pin_offset(logical, definition.dimensions);
        instance.pins.push_back(pin);
    }
    instance.recompute_pins();
    return instance;
}

void ComponentInstance::move_to(const Vec3& position) {
    physical_position = position;
    recompute_pins();
}

void ComponentInstance::recompute_pins() {
    for (auto& pin : pins) {
        pin.world = physical_position + pin.offset;
    }
}

const PhysicalPin* ComponentInstance::find_pin(const std::string& name) const {
    auto it = std::find_if(pins.begin(), pins.end(),
        [&](const PhysicalPin& pin) { return pin.name == name; });
    return it == pins.end() ? nullptr : &*it;
}

}  // namespace panelroute
