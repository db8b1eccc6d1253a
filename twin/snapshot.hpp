#ifndef PANELROUTE_TWIN_SNAPSHOT_HPP
#define PANELROUTE_TWIN_SNAPSHOT_HPP

#include <panel/component_definition.hpp>
#include <panel/component_instance.hpp>
#include <panel/connection.hpp>
#include <panel/enclosure.hpp>
#include <cstdint>
#include <vector>

namespace panelroute {

// Whole-state record exchanged with persistence and exporters
struct Snapshot {
    Enclosure enclosure;
    std::vector<ComponentDefinition> library;
    std::vector<ComponentInstance> instances;
    std::vector<LogicalConnection> connections;
    std::vector<Wire> wires;

    // Id counters, so ids stay unique across save/load
    uint64_t next_instance = 1;
    uint64_t next_connection = 1;
    uint64_t next_wire = 1;
};

// Which wire waypoints an export carries
enum class SnapshotRoutes {
    ManualOnly,     // Computed routes are dropped and recomputed after load
    All
};

}  // namespace panelroute

#endif // PANELROUTE_TWIN_SNAPSHOT_HPP
