#include <gtest/gtest.h>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <panel/component_library.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/panel_json.hpp>
#include <twin/digital_twin.hpp>

using namespace panelroute;

TEST(PinRefTest, ParseSplitsAtLastColon) {
    auto ref = PinRef::parse("MCB_1:L1");
    ASSERT_TRUE(ref.has_value());
    EXPECT_EQ(ref->instance_id, "MCB_1");
    EXPECT_EQ(ref->pin, "L1");
    EXPECT_EQ(ref->to_string(), "MCB_1:L1");

    auto nested = PinRef::parse("cab:inet:PE");
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(nested->instance_id, "cab:inet");
    EXPECT_EQ(nested->pin, "PE");
}

TEST(PinRefTest, ParseRejectsMalformedText) {
    EXPECT_FALSE(PinRef::parse("MCB_1").has_value());
    EXPECT_FALSE(PinRef::parse(":L1").has_value());
    EXPECT_FALSE(PinRef::parse("MCB_1:").has_value());
}

TEST(PanelTypesTest, NamesRoundTrip) {
    EXPECT_EQ(pin_type_from_string("NEUTRAL"), std::optional<PinType>(PinType::Neutral));
    EXPECT_EQ(component_type_from_string("POWER_SUPPLY"),
              std::optional<ComponentType>(ComponentType::PowerSupply));
    EXPECT_FALSE(wire_type_from_string("power").has_value());
}

TEST(ConfigJsonTest, MissingKeysKeepDefaults) {
    nlohmann::json j = {{"resolution", 5.0f}};
    RoutingConfig routing = j.get<RoutingConfig>();
    EXPECT_FLOAT_EQ(routing.resolution, 5.0f);
    EXPECT_FLOAT_EQ(routing.clearance, 2.0f);
    EXPECT_EQ(routing.max_expanded_nodes, 0u);

    PlacementConfig placement = nlohmann::json::object().get<PlacementConfig>();
    EXPECT_FLOAT_EQ(placement.module_width, 17.5f);
    EXPECT_FLOAT_EQ(placement.snap_tolerance, 30.0f);
}

TEST(PanelJsonTest, EnumsAreWrittenByName) {
    nlohmann::json j = LogicalPin{"PE", PinType::Ground, 0.0f, 0.5f};
    EXPECT_EQ(j["type"], "GROUND");

    Wire wire;
    wire.id = "wire_1";
    wire.connection_id = "conn_1";
    wire.wire_type = WireType::Ground;
    wire.method = RoutingMethod::Manual;
    nlohmann::json w = wire;
    EXPECT_EQ(w["wire_type"], "GROUND");
    EXPECT_EQ(w["method"], "manual");
    EXPECT_FALSE(w.contains("length"));
}

TEST(PanelJsonTest, ConnectionUsesQualifiedPinRefs) {
    LogicalConnection conn;
    conn.id = "conn_1";
    conn.from = {"MCB_1", "OUT"};
    conn.to = {"RELAY_2", "A1"};
    conn.wire_type = WireType::Signal;

    nlohmann::json j = conn;
    EXPECT_EQ(j["from"], "MCB_1:OUT");
    EXPECT_EQ(j["to"], "RELAY_2:A1");
    EXPECT_FALSE(j.contains("label"));

    LogicalConnection back = j.get<LogicalConnection>();
    EXPECT_EQ(back.from, conn.from);
    EXPECT_EQ(back.to, conn.to);
}

TEST(PanelJsonTest, SnapshotSurvivesJsonAndLoads) {
    ComponentLibrary standard = ComponentLibrary::standard();
    DigitalTwin twin;
    InstanceId a = twin.add_component_instance(*standard.find("finder-55-34-8-230"), {0.0f, 0.0f});
    InstanceId b = twin.add_component_instance(*standard.find("wago-280-901"), {50.0f, 0.0f});
    twin.place_on_rail(a, {-300.0f, 200.0f, -50.0f});
    twin.place_on_rail(b, {-100.0f, 200.0f, -50.0f});
    ConnectionId conn = twin.add_logical_connection({a, "14"}, {b, "IN"});
    ASSERT_TRUE(is_routed(twin.route_wire(conn)));

    nlohmann::json j = snapshot_to_json(twin.export_snapshot(SnapshotRoutes::All));
    std::string text = j.dump(2);

    DigitalTwin restored;
    restored.load_snapshot(snapshot_from_json(nlohmann::json::parse(text)));

    ASSERT_EQ(restored.instances().size(), 2u);
    EXPECT_EQ(restored.instance(a)->rail_id, twin.instance(a)->rail_id);
    EXPECT_EQ(restored.instance(b)->physical_position, twin.instance(b)->physical_position);
    EXPECT_EQ(restored.connection(conn)->wire_type, WireType::Signal);
    EXPECT_EQ(restored.wire_for_connection(conn)->waypoints,
              twin.wire_for_connection(conn)->waypoints);
    EXPECT_EQ(restored.library().size(), 2u);
}

TEST(PanelJsonTest, MalformedSnapshotThrowsSnapshotError) {
    nlohmann::json missing_enclosure = {{"instances", nlohmann::json::array()}};
    EXPECT_THROW(snapshot_from_json(missing_enclosure), SnapshotError);

    nlohmann::json bad_enum = snapshot_to_json(DigitalTwin().export_snapshot());
    bad_enum["connections"] = nlohmann::json::array({{
        {"id", "conn_1"}, {"from", "A:1"}, {"to", "B:2"}, {"wire_type", "PURPLE"}
    }});
    EXPECT_THROW(snapshot_from_json(bad_enum), SnapshotError);

    nlohmann::json bad_ref = snapshot_to_json(DigitalTwin().export_snapshot());
    bad_ref["connections"] = nlohmann::json::array({{
        {"id", "conn_1"}, {"from", "no-colon"}, {"to", "B:2"}, {"wire_type", "SIGNAL"}
    }});
    EXPECT_THROW(snapshot_from_json(bad_ref), SnapshotError);
}

TEST(SerializedDataTest, EnvelopeRequiresData) {
    json::SerializedData data;
    data.step = "project";
    data.data = {{"answer", 42}};
    nlohmann::json j = data.to_json();
    EXPECT_EQ(j["version"], json::SERIALIZATION_VERSION);

    json::SerializedData back = json::SerializedData::from_json(j);
    EXPECT_EQ(back.step, "project");
    EXPECT_EQ(back.data["answer"], 42);

    EXPECT_THROW(json::SerializedData::from_json(nlohmann::json::object()), std::runtime_error);
}

TEST(SerializedDataTest, RejectsOtherMajorVersions) {
    nlohmann::json j = {{"version", "1.4.2"}, {"step", "project"}, {"data", nlohmann::json::object()}};
    EXPECT_NO_THROW(json::SerializedData::from_json(j));

    j["version"] = "2.0.0";
    EXPECT_THROW(json::SerializedData::from_json(j), std::runtime_error);

    // Files without a version are read as the current format
    j.erase("version");
    EXPECT_EQ(json::SerializedData::from_json(j).version, json::SERIALIZATION_VERSION);
}

TEST(LoggingTest, LevelNamesFollowSpdlog) {
    EXPECT_EQ(logging::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(logging::parse_level("warn"), spdlog::level::warn);
    EXPECT_EQ(logging::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(logging::parse_level("off"), spdlog::level::off);
    EXPECT_EQ(logging::parse_level("loud"), spdlog::level::info);
    EXPECT_EQ(logging::parse_level(nullptr), spdlog::level::info);
}
