#ifndef PANELROUTE_ROUTING_OCCUPANCY_GRID_HPP
#define PANELROUTE_ROUTING_OCCUPANCY_GRID_HPP

#include <geometry/aabb.hpp>
#include <geometry/geometry_utils.hpp>
#include <math/vec3.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace panelroute {

// Discretized enclosure volume. Cells live in one flat array indexed
// x + y*W + z*W*H; a cell covers [origin + i*res, origin + (i+1)*res).
class OccupancyGrid {
public:
    OccupancyGrid(int size_x, int size_y, int size_z, float resolution, const Vec3& origin);

    int size_x() const { return size_x_; }
    int size_y() const { return size_y_; }
    int size_z() const { return size_z_; }
    size_t cell_count() const { return blocked_.size(); }
    float resolution() const { return resolution_; }
    const Vec3& origin() const { return origin_; }

    bool in_bounds(const GridCoord& c) const {
        return c.x >= 0 && c.x < size_x_ &&
               c.y >= 0 && c.y < size_y_ &&
               c.z >= 0 && c.z < size_z_;
    }

    // Flat index of an in-bounds coordinate; throws std::out_of_range otherwise
    size_t index(const GridCoord& c) const;

    GridCoord coord(size_t index) const;

    bool is_blocked(const GridCoord& c) const { return blocked_[index(c)] != 0; }
    bool is_blocked(size_t index) const { return blocked_[index] != 0; }

    void block(const GridCoord& c) { blocked_[index(c)] = 1; }

    // Block every cell whose extent strictly overlaps the box.
    // Parts of the box outside the grid are ignored.
    void block_box(const Aabb& box);

    // Unblock a straight run of blocked cells starting at start and moving by
    // step, stopping at the first free cell, the grid edge, or after
    // max_cells cells. Returns the number of cells opened.
    int open_run(const GridCoord& start, const GridCoord& step, int max_cells);

    size_t blocked_count() const;

    GridCoord to_grid(const Vec3& world) const {
        return world_to_grid(world, resolution_, origin_);
    }

    Vec3 to_world(const GridCoord& c) const {
        return grid_to_world(c, resolution_, origin_);
    }

private:
    int size_x_;
    int size_y_;
    int size_z_;
    float resolution_;
    Vec3 origin_;
    std::vector<uint8_t> blocked_;
};

}  // namespace panelroute

#endif // PANELROUTE_ROUTING_OCCUPANCY_GRID_HPP
