#ifndef PANELROUTE_SERIALIZATION_CONFIG_JSON_HPP
#define PANELROUTE_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <placement/placement_service.hpp>
#include <twin/routing_config.hpp>

namespace panelroute {

// RoutingConfig serialization
inline void to_json(nlohmann::json& j, const RoutingConfig& config) {
    j = {
        {"resolution", config.resolution},
        {"clearance", config.clearance},
        {"max_expanded_nodes", config.max_expanded_nodes},
        {"wire_thickness", config.wire_thickness}
    };
}

// Keys missing from j keep the config's current values, so reading with
// get_to() layers j over an existing config
inline void from_json(const nlohmann::json& j, RoutingConfig& config) {
    config.resolution = j.value("resolution", config.resolution);
    config.clearance = j.value("clearance", config.clearance);
    config.max_expanded_nodes = j.value("max_expanded_nodes", config.max_expanded_nodes);
    config.wire_thickness = j.value("wire_thickness", config.wire_thickness);
}

// PlacementConfig serialization
inline void to_json(nlohmann::json& j, const PlacementConfig& config) {
    j = {
        {"module_width", config.module_width},
        {"snap_tolerance", config.snap_tolerance},
        {"clearance", config.clearance}
    };
}

inline void from_json(const nlohmann::json& j, PlacementConfig& config) {
    config.module_width = j.value("module_width", config.module_width);
    config.snap_tolerance = j.value("snap_tolerance", config.snap_tolerance);
    config.clearance = j.value("clearance", config.clearance);
}

}  // namespace panelroute

#endif // PANELROUTE_SERIALIZATION_CONFIG_JSON_HPP
