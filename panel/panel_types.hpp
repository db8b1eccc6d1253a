#ifndef PANELROUTE_PANEL_TYPES_HPP
#define PANELROUTE_PANEL_TYPES_HPP

#include <optional>
#include <string>
#include <string_view>

namespace panelroute {

enum class PinType {
    Power,
    Ground,
    Neutral,
    Input,
    Output
};

enum class WireType {
    Power,
    Signal,
    Ground
};

enum class ComponentType {
    MCB,          // Miniature circuit breaker
    Relay,
    Contactor,
    PLC,
    Timer,
    Sensor,
    Terminal,
    PowerSupply,
    Motor
};

// Canonical upper-case names, as used in labels and persisted files
const char* to_string(PinType type);
const char* to_string(WireType type);
const char* to_string(ComponentType type);

std::optional<PinType> pin_type_from_string(std::string_view name);
std::optional<WireType> wire_type_from_string(std::string_view name);
std::optional<ComponentType> component_type_from_string(std::string_view name);

// Rendering color for a wire type, "#RRGGBB"
const char* wire_color(WireType type);

// Wire type implied by the pin types at both ends of a connection:
// ground wins over power, power/neutral over signal.
WireType infer_wire_type(PinType a, PinType b);

}  // namespace panelroute

#endif // PANELROUTE_PANEL_TYPES_HPP
