#include <gtest/gtest.h>
#include <common/errors.hpp>
#include <panel/component_library.hpp>
#include <routing/grid_builder.hpp>
#include <twin/digital_twin.hpp>

using namespace panelroute;

class DigitalTwinTest : public ::testing::Test {
protected:
    DigitalTwin twin;
    ComponentDefinition mcb;
    ComponentDefinition psu;

    void SetUp() override {
        ComponentLibrary standard = ComponentLibrary::standard();
        twin.load_component_library(standard.definitions());
        mcb = *standard.find("siemens-5sy6-116-7");
        psu = *standard.find("phoenix-quint-ps-100-240ac-24dc-10");
    }

    // Add an MCB and place it at the given body corner
    InstanceId placed_mcb(const Vec3& position) {
        InstanceId id = twin.add_component_instance(mcb, {0.0f, 0.0f});
        twin.update_physical_position(id, position);
        twin.set_physically_placed(id, true);
        return id;
    }

    const PhysicalPin& pin(const InstanceId& id, const std::string& name) {
        return *twin.resolve_pin({id, name}).pin;
    }
};

// ============================================
// Components
// ============================================

TEST_F(DigitalTwinTest, StartsWithStandardPanel) {
    EXPECT_FLOAT_EQ(twin.enclosure().width, 800.0f);
    EXPECT_FLOAT_EQ(twin.enclosure().height, 600.0f);
    EXPECT_FLOAT_EQ(twin.enclosure().depth, 200.0f);
    EXPECT_EQ(twin.enclosure().rails.size(), 3u);
    EXPECT_EQ(twin.library().size(), 7u);
}

TEST_F(DigitalTwinTest, AddComponentCreatesUnplacedInstance) {
    InstanceId first = twin.add_component_instance(mcb, {10.0f, 20.0f});
    InstanceId second = twin.add_component_instance(mcb, {30.0f, 20.0f});

    EXPECT_EQ(first, "MCB_1");
    EXPECT_EQ(second, "MCB_2");

    const ComponentInstance* inst = twin.instance(first);
    ASSERT_NE(inst, nullptr);
    EXPECT_EQ(inst->label, "MCB 1");
    EXPECT_EQ(twin.instance(second)->label, "MCB 2");
    EXPECT_FALSE(inst->physically_placed);
    EXPECT_EQ(inst->physical_position, vec3::zero());
    EXPECT_EQ(inst->schematic_position, (Vec2{10.0f, 20.0f}));
    EXPECT_EQ(inst->pins.size(), mcb.pins.size());
}

TEST_F(DigitalTwinTest, UnknownDefinitionIsAddedToLibrary) {
    ComponentDefinition custom;
    custom.id = "custom-sensor";
    custom.type = ComponentType::Sensor;
    custom.dimensions = {20.0f, 40.0f, 30.0f, 1.0f};
    custom.pins = {{"OUT", PinType::Output, 0.5f, 1.0f}};

    InstanceId id = twin.add_component_instance(custom, {});
    EXPECT_EQ(id, "SENSOR_1");
    EXPECT_NE(twin.definition("custom-sensor"), nullptr);
}

TEST_F(DigitalTwinTest, ConflictingDefinitionIsRejected) {
    ComponentDefinition wider = mcb;
    wider.dimensions.width = 35.0f;
    EXPECT_THROW(twin.add_component_instance(wider, {}), DefinitionConflict);

    ComponentDefinition extra_pin = mcb;
    extra_pin.pins.push_back({"N", PinType::Neutral, 0.5f, 0.2f});
    EXPECT_THROW(twin.add_component_instance(extra_pin, {}), DefinitionConflict);
    EXPECT_TRUE(twin.instances().empty());
    EXPECT_EQ(twin.definition(mcb.id)->pins.size(), 2u);

    // Catalog text alone is not a conflict
    ComponentDefinition renamed = mcb;
    renamed.display_name = "Breaker";
    EXPECT_NO_THROW(twin.add_component_instance(renamed, {}));
    EXPECT_EQ(twin.definition(mcb.id)->display_name, mcb.display_name);
}

TEST_F(DigitalTwinTest, PinsFollowPhysicalPosition) {
    InstanceId id = twin.add_component_instance(mcb, {});
    twin.update_physical_position(id, {-300.0f, 100.0f, -50.0f}, 3u);

    const ComponentInstance* inst = twin.instance(id);
    ASSERT_NE(inst, nullptr);
    EXPECT_EQ(inst->rail_slot, std::optional<uint32_t>(3u));
    for (const auto& p : inst->pins) {
        EXPECT_EQ(p.world, inst->physical_position + p.offset) << p.name;
    }

    // L1 sits on the front face, 20% up the body
    const PhysicalPin& l1 = pin(id, "L1");
    EXPECT_FLOAT_EQ(l1.world.x, -300.0f);
    EXPECT_NEAR(l1.world.y, 117.0f, 1e-4f);
    EXPECT_FLOAT_EQ(l1.world.z, 20.0f);
}

TEST_F(DigitalTwinTest, UpdatingUnknownComponentThrows) {
    EXPECT_THROW(twin.update_physical_position("nope", {}), UnknownComponent);
    EXPECT_THROW(twin.update_schematic_position("nope", {}), UnknownComponent);
    EXPECT_THROW(twin.set_physically_placed("nope", true), UnknownComponent);
    EXPECT_THROW(twin.remove_component_instance("nope"), UnknownComponent);
}

TEST_F(DigitalTwinTest, PlaceOnRailSnapsToModule) {
    InstanceId id = twin.add_component_instance(mcb, {});
    auto snap = twin.place_on_rail(id, {-340.0f, 205.0f, -45.0f});

    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->rail_id, "dinrail-1");
    EXPECT_EQ(snap->slot, 1u);

    const ComponentInstance* inst = twin.instance(id);
    EXPECT_TRUE(inst->physically_placed);
    EXPECT_EQ(inst->rail_id, std::optional<std::string>("dinrail-1"));
    EXPECT_FLOAT_EQ(inst->physical_position.x, -332.5f);
    EXPECT_FLOAT_EQ(inst->physical_position.y, 200.0f);
    EXPECT_FLOAT_EQ(inst->physical_position.z, -50.0f);
}

TEST_F(DigitalTwinTest, PlaceOnRailAwayFromRailsChangesNothing) {
    InstanceId id = twin.add_component_instance(mcb, {});
    EXPECT_FALSE(twin.place_on_rail(id, {0.0f, 450.0f, 0.0f}).has_value());
    EXPECT_FALSE(twin.instance(id)->physically_placed);
    EXPECT_EQ(twin.instance(id)->physical_position, vec3::zero());
}

TEST_F(DigitalTwinTest, CollisionsIgnoreUnplacedInstances) {
    InstanceId a = placed_mcb({0.0f, 100.0f, -50.0f});
    InstanceId b = placed_mcb({10.0f, 100.0f, -50.0f});
    InstanceId c = twin.add_component_instance(mcb, {});
    twin.update_physical_position(c, {5.0f, 100.0f, -50.0f});

    CollisionResult result = twin.find_collisions(a);
    ASSERT_EQ(result.colliding_with.size(), 1u);
    EXPECT_EQ(result.colliding_with[0], b);
    EXPECT_FALSE(twin.find_collisions(c).has_collision);
}

// ============================================
// Connections and cascades
// ============================================

TEST_F(DigitalTwinTest, ConnectionCreatesUnroutedWire) {
    InstanceId a = twin.add_component_instance(mcb, {});
    InstanceId b = twin.add_component_instance(mcb, {});

    ConnectionId conn = twin.add_logical_connection({a, "OUT"}, {b, "L1"});
    const LogicalConnection* c = twin.connection(conn);
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->wire_type, WireType::Power);

    const Wire* wire = twin.wire_for_connection(conn);
    ASSERT_NE(wire, nullptr);
    EXPECT_TRUE(wire->waypoints.empty());
    EXPECT_FALSE(wire->is_routed());
    EXPECT_FALSE(wire->length.has_value());
    EXPECT_EQ(wire->color, "#FF0000");
    EXPECT_FLOAT_EQ(wire->thickness, 2.0f);
    EXPECT_EQ(twin.wires().size(), 1u);
}

TEST_F(DigitalTwinTest, WireTypeIsInferredFromPins) {
    InstanceId supply = twin.add_component_instance(psu, {});
    InstanceId a = twin.add_component_instance(mcb, {});

    ConnectionId ground = twin.add_logical_connection({supply, "PE"}, {a, "OUT"});
    EXPECT_EQ(twin.connection(ground)->wire_type, WireType::Ground);
    EXPECT_EQ(twin.wire_for_connection(ground)->color, "#00FF00");

    ConnectionId signal = twin.add_logical_connection({supply, "+24V"}, {a, "OUT"});
    EXPECT_EQ(twin.connection(signal)->wire_type, WireType::Signal);
    EXPECT_EQ(twin.wire_for_connection(signal)->color, "#0000FF");

    ConnectionId forced = twin.add_logical_connection({supply, "+24V"}, {a, "OUT"},
                                                      WireType::Power, std::string("24V feed"));
    EXPECT_EQ(twin.connection(forced)->wire_type, WireType::Power);
    EXPECT_EQ(twin.connection(forced)->label, std::optional<std::string>("24V feed"));
}

TEST_F(DigitalTwinTest, ConnectionToUnknownPinThrows) {
    InstanceId a = twin.add_component_instance(mcb, {});
    EXPECT_THROW(twin.add_logical_connection({a, "L1"}, {a, "NOPE"}), UnknownPin);
    EXPECT_THROW(twin.add_logical_connection({"ghost", "L1"}, {a, "L1"}), UnknownPin);
    EXPECT_TRUE(twin.connections().empty());
    EXPECT_TRUE(twin.wires().empty());
}

TEST_F(DigitalTwinTest, RemovingComponentCascadesToConnectionsAndWires) {
    InstanceId a = twin.add_component_instance(mcb, {});
    InstanceId b = twin.add_component_instance(mcb, {});
    InstanceId c = twin.add_component_instance(mcb, {});

    ConnectionId ab = twin.add_logical_connection({a, "OUT"}, {b, "L1"});
    ConnectionId bc = twin.add_logical_connection({b, "OUT"}, {c, "L1"});
    ConnectionId ac = twin.add_logical_connection({a, "L1"}, {c, "OUT"});

    twin.remove_component_instance(b);

    EXPECT_EQ(twin.instance(b), nullptr);
    EXPECT_EQ(twin.connection(ab), nullptr);
    EXPECT_EQ(twin.connection(bc), nullptr);
    EXPECT_EQ(twin.wire_for_connection(ab), nullptr);
    EXPECT_EQ(twin.wire_for_connection(bc), nullptr);

    ASSERT_EQ(twin.connections().size(), 1u);
    EXPECT_EQ(twin.connections()[0].id, ac);
    ASSERT_EQ(twin.wires().size(), 1u);
    EXPECT_EQ(twin.wires()[0].connection_id, ac);

    // No connection references a removed instance
    for (const auto& conn : twin.connections()) {
        EXPECT_NE(twin.instance(conn.from.instance_id), nullptr);
        EXPECT_NE(twin.instance(conn.to.instance_id), nullptr);
    }
}

TEST_F(DigitalTwinTest, RemoveConnectionRemovesItsWire) {
    InstanceId a = twin.add_component_instance(mcb, {});
    InstanceId b = twin.add_component_instance(mcb, {});
    ConnectionId conn = twin.add_logical_connection({a, "OUT"}, {b, "L1"});

    twin.remove_connection(conn);
    EXPECT_TRUE(twin.connections().empty());
    EXPECT_TRUE(twin.wires().empty());
    EXPECT_THROW(twin.remove_connection(conn), UnknownConnection);
}

TEST_F(DigitalTwinTest, IdsAreNotReusedAfterRemoval) {
    InstanceId first = twin.add_component_instance(mcb, {});
    twin.remove_component_instance(first);
    InstanceId second = twin.add_component_instance(mcb, {});
    EXPECT_NE(first, second);
}

// ============================================
// Routing
// ============================================

TEST_F(DigitalTwinTest, RouteWireConnectsPlacedPins) {
    InstanceId a = placed_mcb({-300.0f, 100.0f, -50.0f});
    InstanceId b = placed_mcb({0.0f, 100.0f, -50.0f});
    ConnectionId conn = twin.add_logical_connection({a, "OUT"}, {b, "L1"});

    PathResult result = twin.route_wire(conn);
    ASSERT_TRUE(is_routed(result));

    const Wire* wire = twin.wire_for_connection(conn);
    ASSERT_TRUE(wire->is_routed());
    ASSERT_TRUE(wire->length.has_value());
    EXPECT_EQ(wire->method, RoutingMethod::Manhattan);

    // Endpoints are the centers of the pin cells
    const auto& routed = std::get<Routed>(result);
    OccupancyGrid grid = GridBuilder::build(twin.enclosure(), twin.instances(),
                                            twin.routing_config().resolution);
    EXPECT_EQ(grid.to_grid(wire->waypoints.front().position), grid.to_grid(pin(a, "OUT").world));
    EXPECT_EQ(grid.to_grid(wire->waypoints.back().position), grid.to_grid(pin(b, "L1").world));
    EXPECT_EQ(wire->waypoints.size(), routed.waypoints.size());

    // Every segment is axis-aligned
    for (size_t i = 1; i < wire->waypoints.size(); ++i) {
        Vec3 d = wire->waypoints[i].position - wire->waypoints[i - 1].position;
        int moving = (d.x != 0.0f) + (d.y != 0.0f) + (d.z != 0.0f);
        EXPECT_LE(moving, 1);
        EXPECT_FALSE(wire->waypoints[i].user_anchored);
    }
    EXPECT_NEAR(*wire->length, routed.steps * twin.routing_config().resolution, 1e-2f);
}

TEST_F(DigitalTwinTest, RoutingIsIdempotent) {
    InstanceId a = placed_mcb({-300.0f, 100.0f, -50.0f});
    InstanceId b = placed_mcb({0.0f, 200.0f, -50.0f});
    ConnectionId conn = twin.add_logical_connection({a, "OUT"}, {b, "L1"});

    ASSERT_TRUE(is_routed(twin.route_wire(conn)));
    std::vector<Waypoint> first = twin.wire_for_connection(conn)->waypoints;

    ASSERT_TRUE(is_routed(twin.route_wire(conn)));
    EXPECT_EQ(twin.wire_for_connection(conn)->waypoints, first);
}

TEST_F(DigitalTwinTest, MovingDoesNotReroute) {
    InstanceId a = placed_mcb({-300.0f, 100.0f, -50.0f});
    InstanceId b = placed_mcb({0.0f, 100.0f, -50.0f});
    ConnectionId conn = twin.add_logical_connection({a, "OUT"}, {b, "L1"});
    ASSERT_TRUE(is_routed(twin.route_wire(conn)));
    std::vector<Waypoint> before = twin.wire_for_connection(conn)->waypoints;

    twin.update_physical_position(b, {200.0f, 300.0f, -50.0f});
    EXPECT_EQ(twin.wire_for_connection(conn)->waypoints, before);
}

TEST_F(DigitalTwinTest, RouteOutsideEnclosureIsOutOfBounds) {
    InstanceId a = placed_mcb({-300.0f, 100.0f, -50.0f});
    InstanceId b = placed_mcb({0.0f, 100.0f, -50.0f});
    ConnectionId conn = twin.add_logical_connection({a, "OUT"}, {b, "L1"});

    Enclosure small;
    small.width = 100.0f;
    small.height = 100.0f;
    small.depth = 100.0f;
    small.origin = Vec3(1000.0f, 1000.0f, 1000.0f);

    PathResult result = twin.route_wire(conn, small, 10.0f);
    ASSERT_FALSE(is_routed(result));
    EXPECT_EQ(std::get<Unroutable>(result).reason, UnroutableReason::OutOfBounds);
    EXPECT_FALSE(twin.wire_for_connection(conn)->is_routed());
}

TEST_F(DigitalTwinTest, FailedRouteClearsPreviousWaypoints) {
    InstanceId a = placed_mcb({-300.0f, 100.0f, -50.0f});
    InstanceId b = placed_mcb({0.0f, 100.0f, -50.0f});
    ConnectionId conn = twin.add_logical_connection({a, "OUT"}, {b, "L1"});
    ASSERT_TRUE(is_routed(twin.route_wire(conn)));

    RoutingConfig config = twin.routing_config();
    config.max_expanded_nodes = 1;
    twin.set_routing_config(config);

    PathResult result = twin.route_wire(conn);
    ASSERT_FALSE(is_routed(result));
    EXPECT_EQ(std::get<Unroutable>(result).reason, UnroutableReason::SearchLimitExceeded);

    const Wire* wire = twin.wire_for_connection(conn);
    EXPECT_TRUE(wire->waypoints.empty());
    EXPECT_FALSE(wire->length.has_value());
}

TEST_F(DigitalTwinTest, InvalidResolutionThrowsBeforeMutation) {
    InstanceId a = placed_mcb({-300.0f, 100.0f, -50.0f});
    InstanceId b = placed_mcb({0.0f, 100.0f, -50.0f});
    ConnectionId conn = twin.add_logical_connection({a, "OUT"}, {b, "L1"});
    ASSERT_TRUE(is_routed(twin.route_wire(conn)));
    std::vector<Waypoint> before = twin.wire_for_connection(conn)->waypoints;

    EXPECT_THROW(twin.route_wire(conn, twin.enclosure(), 0.0f), InvalidGridParameters);
    EXPECT_EQ(twin.wire_for_connection(conn)->waypoints, before);
    EXPECT_THROW(twin.route_wire(conn, twin.enclosure(), 1e-6f), InvalidGridParameters);
    EXPECT_EQ(twin.wire_for_connection(conn)->waypoints, before);
    EXPECT_THROW(twin.route_wire("conn_missing"), UnknownConnection);
}

TEST_F(DigitalTwinTest, RouteAllWiresReportsEveryConnection) {
    InstanceId a = placed_mcb({-300.0f, 100.0f, -50.0f});
    InstanceId b = placed_mcb({0.0f, 100.0f, -50.0f});
    InstanceId c = placed_mcb({200.0f, 200.0f, -50.0f});
    twin.add_logical_connection({a, "OUT"}, {b, "L1"});
    twin.add_logical_connection({b, "OUT"}, {c, "L1"});

    RoutingReport report = twin.route_all_wires();
    EXPECT_EQ(report.routed, 2u);
    EXPECT_EQ(report.unroutable(), 0u);
    for (const auto& wire : twin.wires()) {
        EXPECT_TRUE(wire.is_routed()) << wire.id;
    }
}

TEST_F(DigitalTwinTest, ManualWaypointsReplaceRoute) {
    InstanceId a = twin.add_component_instance(mcb, {});
    InstanceId b = twin.add_component_instance(mcb, {});
    ConnectionId conn = twin.add_logical_connection({a, "OUT"}, {b, "L1"});
    WireId wire_id = twin.wire_for_connection(conn)->id;

    twin.update_wire_waypoints(wire_id, {
        {{0.0f, 0.0f, 0.0f}, true},
        {{30.0f, 0.0f, 0.0f}, true},
        {{30.0f, 40.0f, 0.0f}, true}
    });

    const Wire* wire = twin.wire(wire_id);
    EXPECT_EQ(wire->method, RoutingMethod::Manual);
    ASSERT_TRUE(wire->length.has_value());
    EXPECT_FLOAT_EQ(*wire->length, 70.0f);
    EXPECT_THROW(twin.update_wire_waypoints("wire_missing", {}), UnknownWire);
}
