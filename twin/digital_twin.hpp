#ifndef PANELROUTE_TWIN_DIGITAL_TWIN_HPP
#define PANELROUTE_TWIN_DIGITAL_TWIN_HPP

#include "routing_config.hpp"
#include "snapshot.hpp"
#include <panel/component_instance.hpp>
#include <panel/component_library.hpp>
#include <panel/connection.hpp>
#include <panel/enclosure.hpp>
#include <placement/placement_service.hpp>
#include <routing/occupancy_grid.hpp>
#include <routing/path_search.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace panelroute {

// Outcome of routing every wire in one pass
struct RoutingReport {
    size_t routed = 0;
    std::vector<std::pair<ConnectionId, UnroutableReason>> failures;

    size_t unroutable() const { return failures.size(); }
};

// A pin resolved to its owning instance
struct ResolvedPin {
    const ComponentInstance* instance = nullptr;
    const PhysicalPin* pin = nullptr;
};

// Single source of truth for component instances, logical connections and
// their wires.
//
// Every mutating call either completes or throws before touching state, so
// readers never observe a connection whose pins are gone or a wire without
// its connection. Moving a component never re-routes; routing happens only
// through route_wire / route_all_wires.
class DigitalTwin {
public:
    explicit DigitalTwin(Enclosure enclosure = Enclosure::standard_panel(),
                         RoutingConfig routing = RoutingConfig{},
                         PlacementConfig placement = PlacementConfig{});

    // Library and enclosure
    void load_component_library(const std::vector<ComponentDefinition>& definitions);
    const ComponentLibrary& library() const { return library_; }
    const ComponentDefinition* definition(const std::string& id) const {
        return library_.find(id);
    }

    // Throws InvalidEnclosure
    void set_enclosure(const Enclosure& enclosure);
    const Enclosure& enclosure() const { return enclosure_; }

    const RoutingConfig& routing_config() const { return routing_; }
    void set_routing_config(const RoutingConfig& config) { routing_ = config; }
    const PlacementConfig& placement_config() const { return placement_; }
    void set_placement_config(const PlacementConfig& config) { placement_ = config; }

    // Components

    // New unplaced instance at the origin, labelled "<TYPE> N". The
    // definition is added to the library if it is not there yet. Throws
    // DefinitionConflict if the library holds a different layout under the
    // same id.
    InstanceId add_component_instance(const ComponentDefinition& definition,
                                      const Vec2& schematic_position);

    // Removes the instance, then its connections, then their wires.
    // Throws UnknownComponent.
    void remove_component_instance(const InstanceId& id);

    void update_schematic_position(const InstanceId& id, const Vec2& position);

    // Moves the body and recomputes its pins. Wires are left as they are.
    void update_physical_position(const InstanceId& id, const Vec3& position,
                                  std::optional<uint32_t> rail_slot = std::nullopt);

    void set_physically_placed(const InstanceId& id, bool placed);

    // Snap onto the first rail within tolerance and mark the instance placed.
    // Returns nullopt and leaves the instance unchanged if no rail qualifies.
    std::optional<SnapResult> place_on_rail(const InstanceId& id, const Vec3& position);

    CollisionResult find_collisions(const InstanceId& id) const;

    // Connections and wires

    // Creates the connection and its (unrouted) wire. The wire type is
    // inferred from the pin types when not given. Throws UnknownPin.
    ConnectionId add_logical_connection(const PinRef& from, const PinRef& to,
                                        std::optional<WireType> wire_type = std::nullopt,
                                        std::optional<std::string> label = std::nullopt);

    // Removes the connection and its wire. Throws UnknownConnection.
    void remove_connection(const ConnectionId& id);

    // Route one wire through a fresh grid built from the current placements.
    // On Unroutable the wire is left without waypoints. Throws
    // UnknownConnection, or InvalidGridParameters before any mutation.
    PathResult route_wire(const ConnectionId& connection_id,
                          const Enclosure& enclosure, float resolution);

    // Same, with the stored enclosure and configured resolution
    PathResult route_wire(const ConnectionId& connection_id);

    // Route every wire, in connection order, against one grid
    RoutingReport route_all_wires();

    // Replace a wire's path by hand. Throws UnknownWire.
    void update_wire_waypoints(const WireId& wire_id, std::vector<Waypoint> waypoints);

    // Queries. Returned references are invalidated by the next mutation.
    const std::vector<ComponentInstance>& instances() const { return instances_; }
    const std::vector<LogicalConnection>& connections() const { return connections_; }
    const std::vector<Wire>& wires() const { return wires_; }

    const ComponentInstance* instance(const InstanceId& id) const;
    const LogicalConnection* connection(const ConnectionId& id) const;
    const Wire* wire(const WireId& id) const;
    const Wire* wire_for_connection(const ConnectionId& id) const;

    // Throws UnknownPin
    ResolvedPin resolve_pin(const PinRef& ref) const;

    // Snapshots
    Snapshot export_snapshot(SnapshotRoutes routes = SnapshotRoutes::ManualOnly) const;

    // Validates the whole snapshot, then replaces all state. Throws
    // SnapshotError and leaves the twin untouched on any violation.
    // Manhattan wires stored without waypoints are then routed again; the
    // report covers only those wires, and unroutable ones stay empty.
    RoutingReport load_snapshot(const Snapshot& snapshot);

private:
    ComponentInstance& instance_ref(const InstanceId& id);
    Wire& wire_ref_for_connection(const ConnectionId& id);

    // Route every connection against one grid, or only the Manhattan wires
    // that have no waypoints
    RoutingReport route_connections(bool missing_only);

    // Search on a copy of base with terminal corridors opened, then write
    // the result onto the connection's wire
    PathResult route_on_grid(const OccupancyGrid& base, const LogicalConnection& connection);

    // Unblock the cells in front of a terminal that lie inside its own
    // component's padded body, so the wire can leave the component
    void open_terminal(OccupancyGrid& grid, const ComponentInstance& owner,
                       const PhysicalPin& pin) const;

    Enclosure enclosure_;
    RoutingConfig routing_;
    PlacementConfig placement_;
    ComponentLibrary library_;

    std::vector<ComponentInstance> instances_;
    std::vector<LogicalConnection> connections_;
    std::vector<Wire> wires_;

    uint64_t next_instance_ = 1;
    uint64_t next_connection_ = 1;
    uint64_t next_wire_ = 1;
};

}  // namespace panelroute

#endif // PANELROUTE_TWIN_DIGITAL_TWIN_HPP
