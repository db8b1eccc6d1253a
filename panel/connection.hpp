#ifndef PANELROUTE_PANEL_CONNECTION_HPP
#define PANELROUTE_PANEL_CONNECTION_HPP

#include "component_instance.hpp"
#include "panel_types.hpp"
#include <math/vec3.hpp>
#include <optional>
#include <string>
#include <vector>

namespace panelroute {

using ConnectionId = std::string;
using WireId = std::string;

// A pin addressed through its owning instance: "<instance_id>:<pin_name>"
struct PinRef {
    InstanceId instance_id;
    std::string pin;

    std::string to_string() const { return instance_id + ":" + pin; }

    // Splits at the last ':'; nullopt if either half is empty
    static std::optional<PinRef> parse(const std::string& text);

    bool operator==(const PinRef& other) const {
        return instance_id == other.instance_id && pin == other.pin;
    }
};

// Schematic-level connection between two pins (unordered pair)
struct LogicalConnection {
    ConnectionId id;
    PinRef from;
    PinRef to;
    WireType wire_type = WireType::Signal;
    std::optional<std::string> label;

    bool references(const InstanceId& instance) const {
        return from.instance_id == instance || to.instance_id == instance;
    }
};

struct Waypoint {
    Vec3 position;
    bool user_anchored = false;     // Placed by hand rather than computed

    bool operator==(const Waypoint& other) const {
        return position == other.position && user_anchored == other.user_anchored;
    }
};

enum class RoutingMethod {
    Manhattan,      // Computed by the path search
    Manual          // Waypoints supplied by the user
};

// Physical routing result for exactly one logical connection
struct Wire {
    WireId id;
    ConnectionId connection_id;
    std::vector<Waypoint> waypoints;
    WireType wire_type = WireType::Signal;
    std::string color;
    float thickness = 2.0f;         // Diameter, mm
    RoutingMethod method = RoutingMethod::Manhattan;
    std::optional<float> length;    // Only set when routed

    bool is_routed() const { return waypoints.size() >= 2; }

    // Replace the waypoints and recompute the length
    void set_waypoints(std::vector<Waypoint> points);

    void clear_route() {
        waypoints.clear();
        length.reset();
    }
};

// Polyline length; nullopt for fewer than two points
std::optional<float> polyline_length(const std::vector<Waypoint>& waypoints);

}  // namespace panelroute

#endif // PANELROUTE_PANEL_CONNECTION_HPP
