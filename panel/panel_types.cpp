#include "panel_types.hpp"

namespace panelroute {

const char* to_string(PinType type) {
    switch (type) {
        case PinType::Power: return "POWER";
        case PinType::Ground: return "GROUND";
        case PinType::Neutral: return "NEUTRAL";
        case PinType::Input: return "INPUT";
        case PinType::Output: return "OUTPUT";
    }
    return "UNKNOWN";
}

const char* to_string(WireType type) {
    switch (type) {
        case WireType::Power: return "POWER";
        case WireType::Signal: return "SIGNAL";
        case WireType::Ground: return "GROUND";
    }
    return "UNKNOWN";
}

const char* to_string(ComponentType type) {
    switch (type) {
        case ComponentType::MCB: return "MCB";
        case ComponentType::Relay: return "RELAY";
        case ComponentType::Contactor: return "CONTACTOR";
        case ComponentType::PLC: return "PLC";
        case ComponentType::Timer: return "TIMER";
        case ComponentType::Sensor: return "SENSOR";
        case ComponentType::Terminal: return "TERMINAL";
        case ComponentType::PowerSupply: return "POWER_SUPPLY";
        case ComponentType::Motor: return "MOTOR";
    }
    return "UNKNOWN";
}

std::optional<PinType> pin_type_from_string(std::string_view name) {
    for (PinType type : {PinType::Power, PinType::Ground, PinType::Neutral,
                         PinType::Input, PinType::Output}) {
        if (name == to_string(type)) return type;
    }
    return std::nullopt;
}

std::optional<WireType> wire_type_from_string(std::string_view name) {
    for (WireType type : {WireType::Power, WireType::Signal, WireType::Ground}) {
        if (name == to_string(type)) return type;
    }
    return std::nullopt;
}

std::optional<ComponentType> component_type_from_string(std::string_view name) {
    for (ComponentType type : {ComponentType::MCB, ComponentType::Relay,
                               ComponentType::Contactor, ComponentType::PLC,
                               ComponentType::Timer, ComponentType::Sensor,
                               ComponentType::Terminal, ComponentType::PowerSupply,
                               ComponentType::Motor}) {
        if (name == to_string(type)) return type;
    }
    return std::nullopt;
}

const char* wire_color(WireType type) {
    switch (type) {
        case WireType::Power: return "#FF0000";
        case WireType::Signal: return "#0000FF";
        case WireType::Ground: return "#00FF00";
    }
    return "#888888";
}

WireType infer_wire_type(PinType a, PinType b) {
    auto is = [&](PinType t) { return a == t || b == t; };
    if (is(PinType::Ground)) {
        return WireType::Ground;
    }
    if (is(PinType::Power) || is(PinType::Neutral)) {
        return WireType::Power;
    }
    return WireType::Signal;
}

}  // namespace panelroute
