#include "path_search.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <queue>

namespace panelroute {

const char* to_string(UnroutableReason reason) {
    switch (reason) {
        case UnroutableReason::OutOfBounds: return "out of bounds";
        case UnroutableReason::NoPath: return "no path";
        case UnroutableReason::SearchLimitExceeded: return "search limit exceeded";
    }
    return "unknown";
}

namespace {

constexpr size_t kNoParent = SIZE_MAX;

// Axis-aligned moves, in expansion order
constexpr GridCoord kNeighbors[6] = {
    {1, 0, 0}, {-1, 0, 0},
    {0, 1, 0}, {0, -1, 0},
    {0, 0, 1}, {0, 0, -1}
};

struct OpenEntry {
    int f;
    uint64_t seq;       // Insertion order
    size_t index;
};

// priority_queue keeps the "largest" on top: lower f first, then later insertion
struct OpenOrder {
    bool operator()(const OpenEntry& a, const OpenEntry& b) const {
        if (a.f != b.f) return a.f > b.f;
        return a.seq < b.seq;
    }
};

int manhattan(const GridCoord& a, const GridCoord& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y) + std::abs(a.z - b.z);
}

// Same reduction as reduce_collinear, on exact integer coordinates
std::vector<GridCoord> reduce_cells(const std::vector<GridCoord>& cells) {
    if (cells.size() <= 2) {
        return cells;
    }
    std::vector<GridCoord> reduced;
    reduced.push_back(cells.front());
    for (size_t i = 1; i + 1 < cells.size(); ++i) {
        GridCoord in = cells[i] - cells[i - 1];
        GridCoord out = cells[i + 1] - cells[i];
        if (!(in == out)) {
            reduced.push_back(cells[i]);
        }
    }
    reduced.push_back(cells.back());
    return reduced;
}

}  // namespace

PathResult find_path(const OccupancyGrid& grid,
                     const Vec3& start_world,
                     const Vec3& end_world,
                     const SearchConfig& config) {
    auto log = logging::get_logger();

    GridCoord start = grid.to_grid(start_world);
    GridCoord goal = grid.to_grid(end_world);

    if (!grid.in_bounds(start) || !grid.in_bounds(goal)) {
        log->debug("find_path: endpoint outside grid ({},{},{}) -> ({},{},{})",
                   start.x, start.y, start.z, goal.x, goal.y, goal.z);
        return Unroutable{UnroutableReason::OutOfBounds, 0};
    }

    const size_t start_idx = grid.index(start);
    const size_t goal_idx = grid.index(goal);
    if (grid.is_blocked(start_idx) || grid.is_blocked(goal_idx)) {
        log->debug("find_path: endpoint cell is blocked");
        return Unroutable{UnroutableReason::NoPath, 0};
    }

    const size_t limit = config.max_expanded_nodes > 0
        ? config.max_expanded_nodes : grid.cell_count();

    // Search arena, parallel to the grid's cell array
    std::vector<int> g_score(grid.cell_count(), INT_MAX);
    std::vector<size_t> parent(grid.cell_count(), kNoParent);
    std::vector<uint8_t> closed(grid.cell_count(), 0);

    std::priority_queue<OpenEntry, std::vector<OpenEntry>, OpenOrder> open_set;
    uint64_t seq = 0;

    g_score[start_idx] = 0;
    open_set.push({manhattan(start, goal), seq++, start_idx});

    size_t expanded = 0;
    while (!open_set.empty()) {
        OpenEntry current = open_set.top();
        open_set.pop();

        // Stale entry superseded by a cheaper one
        if (closed[current.index]) {
            continue;
        }
        closed[current.index] = 1;
        ++expanded;

        if (current.index == goal_idx) {
            std::vector<GridCoord> cells;
            for (size_t i = goal_idx; i != kNoParent; i = parent[i]) {
                cells.push_back(grid.coord(i));
            }
            std::reverse(cells.begin(), cells.end());

            Routed routed;
            routed.steps = static_cast<int>(cells.size()) - 1;
            routed.expanded = expanded;

            // A single-cell path still yields a zero-length two-point wire
            if (cells.size() == 1) {
                cells.push_back(cells.front());
            }
            for (const auto& c : reduce_cells(cells)) {
                routed.waypoints.push_back(grid.to_world(c));
            }

            log->debug("find_path: {} steps, {} waypoints, {} nodes expanded",
                       routed.steps, routed.waypoints.size(), expanded);
            return routed;
        }

        if (expanded >= limit) {
            log->debug("find_path: expansion limit {} reached", limit);
            return Unroutable{UnroutableReason::SearchLimitExceeded, expanded};
        }

        const GridCoord here = grid.coord(current.index);
        const int next_g = g_score[current.index] + 1;

        for (const auto& step : kNeighbors) {
            GridCoord next = here + step;
            if (!grid.in_bounds(next)) continue;

            size_t next_idx = grid.index(next);
            if (closed[next_idx] || grid.is_blocked(next_idx)) continue;

            if (next_g < g_score[next_idx]) {
                g_score[next_idx] = next_g;
                parent[next_idx] = current.index;
                open_set.push({next_g + manhattan(next, goal), seq++, next_idx});
            }
        }
    }

    log->debug("find_path: open set exhausted after {} expansions", expanded);
    return Unroutable{UnroutableReason::NoPath, expanded};
}

std::vector<Vec3> reduce_collinear(const std::vector<Vec3>& points) {
    if (points.size() <= 2) {
        return points;
    }

    auto direction = [](const Vec3& from, const Vec3& to) {
        Vec3 d = to - from;
        float len = d.length();
        return len > 0.0f ? d / len : vec3::zero();
    };

    constexpr float kTolerance = 1e-5f;
    std::vector<Vec3> reduced;
    reduced.push_back(points.front());
    for (size_t i = 1; i + 1 < points.size(); ++i) {
        Vec3 in = direction(points[i - 1], points[i]);
        Vec3 out = direction(points[i], points[i + 1]);
        if ((in - out).length_squared() > kTolerance * kTolerance) {
            reduced.push_back(points[i]);
        }
    }
    reduced.push_back(points.back());
    return reduced;
}

}  // namespace panelroute
