#ifndef PANELROUTE_ROUTING_GRID_BUILDER_HPP
#define PANELROUTE_ROUTING_GRID_BUILDER_HPP

#include "occupancy_grid.hpp"
#include <panel/component_instance.hpp>
#include <panel/enclosure.hpp>
#include <cstdint>
#include <vector>

namespace panelroute {

// Builds occupancy grids from the current component placements
class GridBuilder {
public:
    // Upper bound on the cells of one grid. The search keeps about 13 bytes
    // of state per cell on top of the grid itself.
    static constexpr uint64_t MAX_CELLS = uint64_t{1} << 26;

    // Grid of ceil(dimension / resolution) cells per axis. Each physically
    // placed instance blocks the cells under its body padded by clearance;
    // unplaced instances are ignored. Throws InvalidGridParameters when the
    // resolution or an enclosure dimension is non-positive, the clearance
    // is negative, or the grid would exceed MAX_CELLS.
    static OccupancyGrid build(const Enclosure& enclosure,
                               const std::vector<ComponentInstance>& instances,
                               float resolution,
                               float clearance = 0.0f);

    // Per-axis cell counts. Throws InvalidGridParameters on malformed inputs
    // or an oversized grid.
    static GridCoord validate(const Enclosure& enclosure, float resolution, float clearance);
};

}  // namespace panelroute

#endif // PANELROUTE_ROUTING_GRID_BUILDER_HPP
