#include "connection.hpp"

namespace panelroute {

std::optional<PinRef> PinRef::parse(const std::string& text) {
    auto sep = text.find_last_of(':');
    if (sep == std::string::npos || sep == 0 || sep + 1 >= text.size()) {
        return std::nullopt;
    }
    return PinRef{text.substr(0, sep), text.substr(sep + 1)};
}

void Wire::set_waypoints(std::vector<Waypoint> points) {
    waypoints = std::move(points);
    length = polyline_length(waypoints);
}

std::optional<float> polyline_length(const std::vector<Waypoint>& waypoints) {
    if (waypoints.size() < 2) {
        return std::nullopt;
    }
    float total = 0.0f;
    for (size_t i = 1; i < waypoints.size(); ++i) {
        total += waypoints[i - 1].position.distance_to(waypoints[i].position);
    }
    return total;
}

}  // namespace panelroute
