#include "occupancy_grid.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace panelroute {

OccupancyGrid::OccupancyGrid(int size_x, int size_y, int size_z,
                             float resolution, const Vec3& origin)
    : size_x_(size_x), size_y_(size_y), size_z_(size_z),
      resolution_(resolution), origin_(origin) {
    if (size_x <= 0 || size_y <= 0 || size_z <= 0) {
        throw std::invalid_argument("OccupancyGrid: sizes must be positive");
    }
    const size_t layer = static_cast<size_t>(size_x) * static_cast<size_t>(size_y);
    if (layer > std::numeric_limits<size_t>::max() / static_cast<size_t>(size_z)) {
        throw std::length_error("OccupancyGrid: cell count overflows");
    }
    blocked_.assign(layer * static_cast<size_t>(size_z), 0);
}

size_t OccupancyGrid::index(const GridCoord& c) const {
    if (!in_bounds(c)) {
        throw std::out_of_range("OccupancyGrid::index: coordinate outside grid");
    }
    return static_cast<size_t>(c.x) +
           static_cast<size_t>(c.y) * size_x_ +
           static_cast<size_t>(c.z) * size_x_ * size_y_;
}

GridCoord OccupancyGrid::coord(size_t index) const {
    const size_t layer = static_cast<size_t>(size_x_) * size_y_;
    return {
        static_cast<int>(index % size_x_),
        static_cast<int>((index % layer) / size_x_),
        static_cast<int>(index / layer)
    };
}

void OccupancyGrid::block_box(const Aabb& box) {
    // Cell i overlaps [min, max) strictly when i*res < max and (i+1)*res > min.
    // Bounds are clipped in double before any int cast.
    int lo[3];
    int hi[3];
    const int sizes[3] = {size_x_, size_y_, size_z_};
    for (size_t axis = 0; axis < 3; ++axis) {
        float min_local = (box.min[axis] - origin_[axis]) / resolution_;
        float max_local = (box.max[axis] - origin_[axis]) / resolution_;
        if (!(min_local <= max_local)) {
            return;
        }
        double first = std::max(0.0, static_cast<double>(std::floor(min_local)));
        double last = std::min(static_cast<double>(sizes[axis] - 1),
                               static_cast<double>(std::ceil(max_local)) - 1.0);
        if (first > last) {
            return;
        }
        lo[axis] = static_cast<int>(first);
        hi[axis] = static_cast<int>(last);
    }

    for (int z = lo[2]; z <= hi[2]; ++z) {
        for (int y = lo[1]; y <= hi[1]; ++y) {
            for (int x = lo[0]; x <= hi[0]; ++x) {
                blocked_[index({x, y, z})] = 1;
            }
        }
    }
}

int OccupancyGrid::open_run(const GridCoord& start, const GridCoord& step, int max_cells) {
    int opened = 0;
    GridCoord c = start;
    while (opened < max_cells && in_bounds(c)) {
        size_t i = index(c);
        if (!blocked_[i]) {
            break;
        }
        blocked_[i] = 0;
        ++opened;
        c = c + step;
    }
    return opened;
}

size_t OccupancyGrid::blocked_count() const {
    return static_cast<size_t>(std::count(blocked_.begin(), blocked_.end(), uint8_t{1}));
}

}  // namespace panelroute
