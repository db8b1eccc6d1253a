#include "grid_builder.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <cmath>
#include <limits>
#include <string>

namespace panelroute {

namespace {

int64_t axis_cells(float extent, float resolution, const char* axis) {
    double cells = std::ceil(static_cast<double>(extent) / static_cast<double>(resolution));
    if (!(cells <= static_cast<double>(std::numeric_limits<int>::max()))) {
        throw InvalidGridParameters(std::string("too many cells along ") + axis);
    }
    return static_cast<int64_t>(cells);
}

}  // namespace

GridCoord GridBuilder::validate(const Enclosure& enclosure, float resolution, float clearance) {
    if (!(resolution > 0.0f)) {
        throw InvalidGridParameters("resolution must be positive");
    }
    if (!(enclosure.width > 0.0f) || !(enclosure.height > 0.0f) || !(enclosure.depth > 0.0f)) {
        throw InvalidGridParameters("enclosure dimensions must be positive");
    }
    if (!(clearance >= 0.0f)) {
        throw InvalidGridParameters("clearance must not be negative");
    }

    int64_t nx = axis_cells(enclosure.width, resolution, "x");
    int64_t ny = axis_cells(enclosure.height, resolution, "y");
    int64_t nz = axis_cells(enclosure.depth, resolution, "z");

    // Each factor is below 2^31, so the partial products cannot overflow
    const auto cap = static_cast<int64_t>(MAX_CELLS);
    if (nx * ny > cap || nx * ny * nz > cap) {
        throw InvalidGridParameters("grid of " + std::to_string(nx) + "x" + std::to_string(ny) +
                                    "x" + std::to_string(nz) + " cells exceeds the limit of " +
                                    std::to_string(MAX_CELLS));
    }
    return GridCoord{static_cast<int>(nx), static_cast<int>(ny), static_cast<int>(nz)};
}

OccupancyGrid GridBuilder::build(const Enclosure& enclosure,
                                 const std::vector<ComponentInstance>& instances,
                                 float resolution,
                                 float clearance) {
    auto log = logging::get_logger();
    const GridCoord cells = validate(enclosure, resolution, clearance);
    const int nx = cells.x;
    const int ny = cells.y;
    const int nz = cells.z;

    OccupancyGrid grid(nx, ny, nz, resolution, enclosure.origin);

    // Marking only ever sets cells, so the result is the union of the
    // obstacle boxes regardless of instance order.
    size_t obstacles = 0;
    for (const auto& instance : instances) {
        if (!instance.physically_placed) continue;
        grid.block_box(instance.footprint(clearance));
        ++obstacles;
    }

    log->debug("Built {}x{}x{} grid at {}mm: {} obstacles, {} blocked cells",
               nx, ny, nz, resolution, obstacles, grid.blocked_count());
    return grid;
}

}  // namespace panelroute
