#ifndef PANELROUTE_TWIN_ROUTING_CONFIG_HPP
#define PANELROUTE_TWIN_ROUTING_CONFIG_HPP

#include <cstddef>

namespace panelroute {

// Parameters for routing passes run by the digital twin
struct RoutingConfig {
    float resolution = 10.0f;           // Grid cell edge, mm
    float clearance = 2.0f;             // Obstacle padding around bodies, mm
    size_t max_expanded_nodes = 0;      // 0 = one per grid cell
    float wire_thickness = 2.0f;        // Diameter of new wires, mm
};

}  // namespace panelroute

#endif // PANELROUTE_TWIN_ROUTING_CONFIG_HPP
