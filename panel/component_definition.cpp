#include "component_definition.hpp"
#include <algorithm>

namespace panelroute {

const LogicalPin* ComponentDefinition::find_pin(const std::string& name) const {
    auto it = std::find_if(pins.begin(), pins.end(),
        [&](const LogicalPin& pin) { return pin.name == name; });
    return it == pins.end() ? nullptr : &*it;
}

bool ComponentDefinition::same_layout(const ComponentDefinition& other) const {
    const Dimensions& a = dimensions;
    const Dimensions& b = other.dimensions;
    if (type != other.type || a.width != b.width || a.height != b.height ||
        a.depth != b.depth || a.din_modules != b.din_modules) {
        return false;
    }
    return std::equal(pins.begin(), pins.end(), other.pins.begin(), other.pins.end(),
        [](const LogicalPin& p, const LogicalPin& q) {
            return p.name == q.name && p.type == q.type && p.u == q.u && p.v == q.v;
        });
}

Vec3 pin_offset(const LogicalPin& pin, const Dimensions& dimensions) {
    return {pin.u * dimensions.width, pin.v * dimensions.height, dimensions.depth};
}

}  // namespace panelroute
