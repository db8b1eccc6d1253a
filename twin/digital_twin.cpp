#include "digital_twin.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <routing/grid_builder.hpp>
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

namespace panelroute {

namespace {

template <typename T>
auto find_by_id(std::vector<T>& items, const std::string& id) {
    return std::find_if(items.begin(), items.end(),
        [&](const T& item) { return item.id == id; });
}

template <typename T>
auto find_by_id(const std::vector<T>& items, const std::string& id) {
    return std::find_if(items.begin(), items.end(),
        [&](const T& item) { return item.id == id; });
}

// "<prefix>_<n>" with n taken from counter and advanced past existing ids
template <typename T>
std::string next_id(const std::string& prefix, uint64_t& counter, const std::vector<T>& existing) {
    std::string id;
    do {
        id = prefix + "_" + std::to_string(counter++);
    } while (find_by_id(existing, id) != existing.end());
    return id;
}

Wire make_wire(const WireId& id, const LogicalConnection& connection, float thickness) {
    Wire wire;
    wire.id = id;
    wire.connection_id = connection.id;
    wire.wire_type = connection.wire_type;
    wire.color = wire_color(connection.wire_type);
    wire.thickness = thickness;
    wire.method = RoutingMethod::Manhattan;
    return wire;
}

}  // namespace

DigitalTwin::DigitalTwin(Enclosure enclosure, RoutingConfig routing, PlacementConfig placement)
    : routing_(routing), placement_(placement) {
    set_enclosure(enclosure);
}

void DigitalTwin::load_component_library(const std::vector<ComponentDefinition>& definitions) {
    for (const auto& def : definitions) {
        library_.add(def);
    }
}

void DigitalTwin::set_enclosure(const Enclosure& enclosure) {
    enclosure.validate();
    enclosure_ = enclosure;
}

// ============================================
// Components
// ============================================

InstanceId DigitalTwin::add_component_instance(const ComponentDefinition& definition,
                                               const Vec2& schematic_position) {
    auto log = logging::get_logger();

    if (const ComponentDefinition* stored = library_.find(definition.id)) {
        if (!stored->same_layout(definition)) {
            throw DefinitionConflict(definition.id);
        }
    } else {
        library_.add(definition);
    }
    const ComponentDefinition& def = *library_.find(definition.id);

    size_t same_definition = std::count_if(instances_.begin(), instances_.end(),
        [&](const ComponentInstance& c) { return c.definition_id == def.id; });

    std::string type_name = to_string(def.type);
    InstanceId id = next_id(type_name, next_instance_, instances_);
    std::string label = type_name + " " + std::to_string(same_definition + 1);

    instances_.push_back(ComponentInstance::create(id, def, label, schematic_position));
    log->debug("Added component {} ({}) as '{}'", id, def.id, label);
    return id;
}

void DigitalTwin::remove_component_instance(const InstanceId& id) {
    auto log = logging::get_logger();

    auto it = find_by_id(instances_, id);
    if (it == instances_.end()) {
        throw UnknownComponent(id);
    }

    // Build the surviving state first, then commit in one step:
    // instance, then its connections, then the orphaned wires.
    std::vector<ComponentInstance> instances = instances_;
    instances.erase(instances.begin() + (it - instances_.begin()));

    std::vector<LogicalConnection> connections;
    std::unordered_set<ConnectionId> kept;
    for (const auto& conn : connections_) {
        if (!conn.references(id)) {
            connections.push_back(conn);
            kept.insert(conn.id);
        }
    }

    std::vector<Wire> wires;
    for (const auto& wire : wires_) {
        if (kept.count(wire.connection_id)) {
            wires.push_back(wire);
        }
    }

    log->debug("Removed component {} with {} connection(s)",
               id, connections_.size() - connections.size());

    instances_ = std::move(instances);
    connections_ = std::move(connections);
    wires_ = std::move(wires);
}

void DigitalTwin::update_schematic_position(const InstanceId& id, const Vec2& position) {
    instance_ref(id).schematic_position = position;
}

void DigitalTwin::update_physical_position(const InstanceId& id, const Vec3& position,
                                           std::optional<uint32_t> rail_slot) {
    ComponentInstance& inst = instance_ref(id);
    inst.move_to(position);
    if (rail_slot) {
        inst.rail_slot = rail_slot;
    }
}

void DigitalTwin::set_physically_placed(const InstanceId& id, bool placed) {
    instance_ref(id).physically_placed = placed;
}

std::optional<SnapResult> DigitalTwin::place_on_rail(const InstanceId& id, const Vec3& position) {
    ComponentInstance& inst = instance_ref(id);

    auto snap = PlacementService::snap_to_nearest_rail(
        position, enclosure_.rails, placement_.module_width, placement_.snap_tolerance);
    if (!snap) {
        return std::nullopt;
    }

    inst.move_to(snap->position);
    inst.rail_slot = snap->slot;
    inst.rail_id = snap->rail_id;
    inst.physically_placed = true;
    return snap;
}

CollisionResult DigitalTwin::find_collisions(const InstanceId& id) const {
    const ComponentInstance* inst = instance(id);
    if (!inst) {
        throw UnknownComponent(id);
    }
    return PlacementService::find_collisions(*inst, instances_, placement_.clearance);
}

// ============================================
// Connections and wires
// ============================================

ConnectionId DigitalTwin::add_logical_connection(const PinRef& from, const PinRef& to,
                                                 std::optional<WireType> wire_type,
                                                 std::optional<std::string> label) {
    ResolvedPin a = resolve_pin(from);
    ResolvedPin b = resolve_pin(to);

    LogicalConnection conn;
    conn.id = next_id("conn", next_connection_, connections_);
    conn.from = from;
    conn.to = to;
    conn.wire_type = wire_type.value_or(infer_wire_type(a.pin->type, b.pin->type));
    conn.label = std::move(label);

    Wire wire = make_wire(next_id("wire", next_wire_, wires_), conn, routing_.wire_thickness);

    connections_.push_back(conn);
    wires_.push_back(wire);

    logging::get_logger()->debug("Connected {} -> {} as {} ({})",
        from.to_string(), to.to_string(), conn.id, to_string(conn.wire_type));
    return conn.id;
}

void DigitalTwin::remove_connection(const ConnectionId& id) {
    auto it = find_by_id(connections_, id);
    if (it == connections_.end()) {
        throw UnknownConnection(id);
    }
    connections_.erase(it);
    wires_.erase(std::remove_if(wires_.begin(), wires_.end(),
        [&](const Wire& w) { return w.connection_id == id; }), wires_.end());
}

PathResult DigitalTwin::route_wire(const ConnectionId& connection_id,
                                   const Enclosure& enclosure, float resolution) {
    auto it = find_by_id(connections_, connection_id);
    if (it == connections_.end()) {
        throw UnknownConnection(connection_id);
    }

    OccupancyGrid grid = GridBuilder::build(enclosure, instances_, resolution, routing_.clearance);
    return route_on_grid(grid, *it);
}

PathResult DigitalTwin::route_wire(const ConnectionId& connection_id) {
    return route_wire(connection_id, enclosure_, routing_.resolution);
}

RoutingReport DigitalTwin::route_all_wires() {
    auto log = logging::get_logger();
    RoutingReport report = route_connections(false);
    log->info("Routed {} of {} wires", report.routed, connections_.size());
    return report;
}

RoutingReport DigitalTwin::route_connections(bool missing_only) {
    RoutingReport report;

    std::vector<const LogicalConnection*> pending;
    for (const auto& conn : connections_) {
        const Wire& wire = wire_ref_for_connection(conn.id);
        if (missing_only &&
            (wire.method != RoutingMethod::Manhattan || !wire.waypoints.empty())) {
            continue;
        }
        pending.push_back(&conn);
    }
    if (pending.empty()) {
        return report;
    }

    OccupancyGrid grid = GridBuilder::build(enclosure_, instances_,
                                            routing_.resolution, routing_.clearance);

    for (const auto* conn : pending) {
        PathResult result = route_on_grid(grid, *conn);
        if (const auto* failure = std::get_if<Unroutable>(&result)) {
            report.failures.emplace_back(conn->id, failure->reason);
        } else {
            ++report.routed;
        }
    }
    return report;
}

PathResult DigitalTwin::route_on_grid(const OccupancyGrid& base, const LogicalConnection& connection) {
    auto log = logging::get_logger();

    ResolvedPin from = resolve_pin(connection.from);
    ResolvedPin to = resolve_pin(connection.to);
    Wire& wire = wire_ref_for_connection(connection.id);

    OccupancyGrid grid = base;
    open_terminal(grid, *from.instance, *from.pin);
    open_terminal(grid, *to.instance, *to.pin);

    SearchConfig search;
    search.max_expanded_nodes = routing_.max_expanded_nodes;
    PathResult result = find_path(grid, from.pin->world, to.pin->world, search);

    if (const auto* routed = std::get_if<Routed>(&result)) {
        std::vector<Waypoint> points;
        points.reserve(routed->waypoints.size());
        for (const auto& p : routed->waypoints) {
            points.push_back(Waypoint{p, false});
        }
        wire.set_waypoints(std::move(points));
        wire.method = RoutingMethod::Manhattan;
        log->debug("Routed {}: {} steps, length {:.1f}mm",
                   connection.id, routed->steps, wire.length.value_or(0.0f));
        return result;
    }

    const auto& failure = std::get<Unroutable>(result);
    wire.clear_route();
    wire.method = RoutingMethod::Manhattan;

    if (failure.reason == UnroutableReason::SearchLimitExceeded) {
        log->warn("Search limit exceeded routing {} ({} -> {}) after {} expansions",
                  connection.id, connection.from.to_string(), connection.to.to_string(),
                  failure.expanded);
    } else {
        log->warn("Cannot route {} ({} -> {}): {}",
                  connection.id, connection.from.to_string(), connection.to.to_string(),
                  to_string(failure.reason));
    }
    return result;
}

void DigitalTwin::open_terminal(OccupancyGrid& grid, const ComponentInstance& owner,
                                const PhysicalPin& pin) const {
    if (!owner.physically_placed) {
        return;
    }

    GridCoord start = grid.to_grid(pin.world);
    if (!grid.in_bounds(start)) {
        return;
    }

    // Terminals face +z; open up to the last cell covered by the padded body
    Aabb box = owner.footprint(routing_.clearance);
    double last_z = std::min(
        static_cast<double>(std::ceil((box.max.z - grid.origin().z) / grid.resolution())) - 1.0,
        static_cast<double>(grid.size_z() - 1));
    if (last_z >= start.z) {
        grid.open_run(start, GridCoord{0, 0, 1}, static_cast<int>(last_z) - start.z + 1);
    }
}

void DigitalTwin::update_wire_waypoints(const WireId& wire_id, std::vector<Waypoint> waypoints) {
    auto it = find_by_id(wires_, wire_id);
    if (it == wires_.end()) {
        throw UnknownWire(wire_id);
    }
    it->set_waypoints(std::move(waypoints));
    it->method = RoutingMethod::Manual;
}

// ============================================
// Queries
// ============================================

const ComponentInstance* DigitalTwin::instance(const InstanceId& id) const {
    auto it = find_by_id(instances_, id);
    return it == instances_.end() ? nullptr : &*it;
}

const LogicalConnection* DigitalTwin::connection(const ConnectionId& id) const {
    auto it = find_by_id(connections_, id);
    return it == connections_.end() ? nullptr : &*it;
}

const Wire* DigitalTwin::wire(const WireId& id) const {
    auto it = find_by_id(wires_, id);
    return it == wires_.end() ? nullptr : &*it;
}

const Wire* DigitalTwin::wire_for_connection(const ConnectionId& id) const {
    auto it = std::find_if(wires_.begin(), wires_.end(),
        [&](const Wire& w) { return w.connection_id == id; });
    return it == wires_.end() ? nullptr : &*it;
}

ResolvedPin DigitalTwin::resolve_pin(const PinRef& ref) const {
    const ComponentInstance* inst = instance(ref.instance_id);
    if (!inst) {
        throw UnknownPin(ref.to_string());
    }
    const PhysicalPin* pin = inst->find_pin(ref.pin);
    if (!pin) {
        throw UnknownPin(ref.to_string());
    }
    return ResolvedPin{inst, pin};
}

ComponentInstance& DigitalTwin::instance_ref(const InstanceId& id) {
    auto it = find_by_id(instances_, id);
    if (it == instances_.end()) {
        throw UnknownComponent(id);
    }
    return *it;
}

Wire& DigitalTwin::wire_ref_for_connection(const ConnectionId& id) {
    auto it = std::find_if(wires_.begin(), wires_.end(),
        [&](const Wire& w) { return w.connection_id == id; });
    if (it == wires_.end()) {
        throw UnknownConnection(id);
    }
    return *it;
}

// ============================================
// Snapshots
// ============================================

Snapshot DigitalTwin::export_snapshot(SnapshotRoutes routes) const {
    Snapshot snapshot;
    snapshot.enclosure = enclosure_;
    snapshot.library = library_.definitions();
    snapshot.instances = instances_;
    snapshot.connections = connections_;
    snapshot.wires = wires_;
    snapshot.next_instance = next_instance_;
    snapshot.next_connection = next_connection_;
    snapshot.next_wire = next_wire_;

    if (routes == SnapshotRoutes::ManualOnly) {
        for (auto& wire : snapshot.wires) {
            if (wire.method == RoutingMethod::Manhattan) {
                wire.clear_route();
            }
        }
    }
    return snapshot;
}

RoutingReport DigitalTwin::load_snapshot(const Snapshot& snapshot) {
    auto log = logging::get_logger();

    try {
        snapshot.enclosure.validate();
    } catch (const InvalidEnclosure& e) {
        throw SnapshotError(e.what());
    }

    ComponentLibrary library;
    for (const auto& def : snapshot.library) {
        if (!library.add(def)) {
            throw SnapshotError("duplicate definition '" + def.id + "'");
        }
    }

    // Instances are rebuilt from their definitions so pins are never stale
    std::vector<ComponentInstance> instances;
    std::unordered_set<InstanceId> instance_ids;
    for (const auto& saved : snapshot.instances) {
        if (!instance_ids.insert(saved.id).second) {
            throw SnapshotError("duplicate instance '" + saved.id + "'");
        }
        const ComponentDefinition* def = library.find(saved.definition_id);
        if (!def) {
            throw SnapshotError("instance '" + saved.id + "' references unknown definition '" +
                                saved.definition_id + "'");
        }
        ComponentInstance inst = ComponentInstance::create(
            saved.id, *def, saved.label, saved.schematic_position);
        inst.physically_placed = saved.physically_placed;
        inst.rail_slot = saved.rail_slot;
        inst.rail_id = saved.rail_id;
        inst.move_to(saved.physical_position);
        instances.push_back(std::move(inst));
    }

    auto pin_exists = [&](const PinRef& ref) {
        auto it = find_by_id(instances, ref.instance_id);
        return it != instances.end() && it->find_pin(ref.pin) != nullptr;
    };

    std::unordered_set<ConnectionId> connection_ids;
    for (const auto& conn : snapshot.connections) {
        if (!connection_ids.insert(conn.id).second) {
            throw SnapshotError("duplicate connection '" + conn.id + "'");
        }
        if (!pin_exists(conn.from) || !pin_exists(conn.to)) {
            throw SnapshotError("connection '" + conn.id + "' references an unknown pin");
        }
    }

    std::vector<Wire> wires;
    std::unordered_set<WireId> wire_ids;
    std::unordered_map<ConnectionId, WireId> wired;
    for (const auto& saved : snapshot.wires) {
        if (!wire_ids.insert(saved.id).second) {
            throw SnapshotError("duplicate wire '" + saved.id + "'");
        }
        auto conn = find_by_id(snapshot.connections, saved.connection_id);
        if (conn == snapshot.connections.end()) {
            throw SnapshotError("wire '" + saved.id + "' references unknown connection '" +
                                saved.connection_id + "'");
        }
        if (!wired.emplace(saved.connection_id, saved.id).second) {
            throw SnapshotError("connection '" + saved.connection_id + "' has more than one wire");
        }
        Wire wire = saved;
        wire.wire_type = conn->wire_type;
        wire.color = wire_color(conn->wire_type);
        wire.set_waypoints(saved.waypoints);
        wires.push_back(std::move(wire));
    }
    for (const auto& conn : snapshot.connections) {
        if (!wired.count(conn.id)) {
            throw SnapshotError("connection '" + conn.id + "' has no wire");
        }
    }

    // Computed routes that were not persisted are recomputed after the
    // commit, so the grid parameters are checked now
    bool needs_routing = std::any_of(wires.begin(), wires.end(), [](const Wire& w) {
        return w.method == RoutingMethod::Manhattan && w.waypoints.empty();
    });
    if (needs_routing) {
        try {
            GridBuilder::validate(snapshot.enclosure, routing_.resolution, routing_.clearance);
        } catch (const InvalidGridParameters& e) {
            throw SnapshotError(std::string("cannot recompute routes: ") + e.what());
        }
    }

    // Everything validated; commit
    enclosure_ = snapshot.enclosure;
    library_ = std::move(library);
    instances_ = std::move(instances);
    connections_ = snapshot.connections;
    wires_ = std::move(wires);
    next_instance_ = std::max<uint64_t>(snapshot.next_instance, 1);
    next_connection_ = std::max<uint64_t>(snapshot.next_connection, 1);
    next_wire_ = std::max<uint64_t>(snapshot.next_wire, 1);

    log->info("Loaded snapshot: {} components, {} connections, {} wires",
              instances_.size(), connections_.size(), wires_.size());

    RoutingReport report = route_connections(true);
    if (report.routed > 0 || report.unroutable() > 0) {
        log->info("Recomputed {} route(s), {} unroutable", report.routed, report.unroutable());
    }
    return report;
}

}  // namespace panelroute
