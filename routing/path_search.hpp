#ifndef PANELROUTE_ROUTING_PATH_SEARCH_HPP
#define PANELROUTE_ROUTING_PATH_SEARCH_HPP

#include "occupancy_grid.hpp"
#include <math/vec3.hpp>
#include <cstddef>
#include <variant>
#include <vector>

namespace panelroute {

enum class UnroutableReason {
    OutOfBounds,            // Start or end lies outside the grid
    NoPath,                 // Search exhausted without reaching the goal
    SearchLimitExceeded     // Expansion bound hit before a result
};

const char* to_string(UnroutableReason reason);

struct SearchConfig {
    // Maximum number of node expansions; 0 means one per grid cell
    size_t max_expanded_nodes = 0;
};

struct Routed {
    std::vector<Vec3> waypoints;    // Cell centers, collinear points removed
    int steps = 0;                  // Grid moves along the path
    size_t expanded = 0;
};

struct Unroutable {
    UnroutableReason reason = UnroutableReason::NoPath;
    size_t expanded = 0;
};

using PathResult = std::variant<Routed, Unroutable>;

inline bool is_routed(const PathResult& result) {
    return std::holds_alternative<Routed>(result);
}

// Shortest 6-connected path between the cells containing start and end.
//
// A* with unit step cost and the Manhattan heuristic, which is consistent on
// this grid, so the returned path is optimal. Neighbors are generated in the
// order +x, -x, +y, -y, +z, -z. The open set is a binary heap ordered by total
// cost; among entries of equal total cost the most recently inserted is
// expanded first, which makes the chosen path deterministic.
//
// Expected failures are returned as Unroutable, never thrown.
PathResult find_path(const OccupancyGrid& grid,
                     const Vec3& start_world,
                     const Vec3& end_world,
                     const SearchConfig& config = SearchConfig{});

// Keep the first and last point and every interior point where the incoming
// and outgoing directions differ.
std::vector<Vec3> reduce_collinear(const std::vector<Vec3>& points);

}  // namespace panelroute

#endif // PANELROUTE_ROUTING_PATH_SEARCH_HPP
