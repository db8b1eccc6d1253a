#ifndef PANELROUTE_PANEL_COMPONENT_DEFINITION_HPP
#define PANELROUTE_PANEL_COMPONENT_DEFINITION_HPP

#include "panel_types.hpp"
#include <math/vec3.hpp>
#include <string>
#include <vector>

namespace panelroute {

// Named electrical terminal on a catalog component
struct LogicalPin {
    std::string name;               // e.g. "L1", "A1", "+24V"
    PinType type = PinType::Input;
    float u = 0.0f;                 // Normalized position across the width [0,1]
    float v = 0.0f;                 // Normalized position up the height [0,1]
};

struct Dimensions {
    float width = 0.0f;
    float height = 0.0f;
    float depth = 0.0f;
    float din_modules = 0.0f;       // 1 module = 17.5mm of rail

    Vec3 size() const { return {width, height, depth}; }
};

// Immutable catalog entry
struct ComponentDefinition {
    std::string id;                 // e.g. "siemens-5sy6-116-7"
    ComponentType type = ComponentType::Terminal;
    std::string manufacturer;
    std::string model_number;
    std::string display_name;
    Dimensions dimensions;
    std::vector<LogicalPin> pins;

    const LogicalPin* find_pin(const std::string& name) const;

    // Same type, dimensions and pins; catalog text is not compared
    bool same_layout(const ComponentDefinition& other) const;
};

// Offset of a pin from the instance's minimum corner. Terminals sit on the
// front face, opposite the mounting plate.
Vec3 pin_offset(const LogicalPin& pin, const Dimensions& dimensions);

}  // namespace panelroute

#endif // PANELROUTE_PANEL_COMPONENT_DEFINITION_HPP
