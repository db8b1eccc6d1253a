#ifndef PANELROUTE_SERIALIZATION_PANEL_JSON_HPP
#define PANELROUTE_SERIALIZATION_PANEL_JSON_HPP

#include <nlohmann/json.hpp>
#include <common/errors.hpp>
#include <math/vec3.hpp>
#include <panel/component_definition.hpp>
#include <panel/component_instance.hpp>
#include <panel/connection.hpp>
#include <panel/enclosure.hpp>
#include <panel/panel_types.hpp>
#include <twin/snapshot.hpp>
#include <stdexcept>
#include <string>

namespace panelroute {

// Vec3 / Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j.at(0).get<float>();
    v.y = j.at(1).get<float>();
    v.z = j.at(2).get<float>();
}

inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    v.x = j.at(0).get<float>();
    v.y = j.at(1).get<float>();
}

// Layout tags; unknown values fall back to the first entry
NLOHMANN_JSON_SERIALIZE_ENUM(RailOrientation, {
    {RailOrientation::Horizontal, "horizontal"},
    {RailOrientation::Vertical, "vertical"}
})

NLOHMANN_JSON_SERIALIZE_ENUM(RoutingMethod, {
    {RoutingMethod::Manhattan, "manhattan"},
    {RoutingMethod::Manual, "manual"}
})

// Electrical type tags are stored by their canonical names and rejected
// when unknown
inline void to_json(nlohmann::json& j, const PinType& type) { j = to_string(type); }
inline void to_json(nlohmann::json& j, const WireType& type) { j = to_string(type); }
inline void to_json(nlohmann::json& j, const ComponentType& type) { j = to_string(type); }

inline void from_json(const nlohmann::json& j, PinType& type) {
    auto parsed = pin_type_from_string(j.get<std::string>());
    if (!parsed) throw std::invalid_argument("unknown pin type: " + j.get<std::string>());
    type = *parsed;
}

inline void from_json(const nlohmann::json& j, WireType& type) {
    auto parsed = wire_type_from_string(j.get<std::string>());
    if (!parsed) throw std::invalid_argument("unknown wire type: " + j.get<std::string>());
    type = *parsed;
}

inline void from_json(const nlohmann::json& j, ComponentType& type) {
    auto parsed = component_type_from_string(j.get<std::string>());
    if (!parsed) throw std::invalid_argument("unknown component type: " + j.get<std::string>());
    type = *parsed;
}

// MountingRail / Enclosure serialization
inline void to_json(nlohmann::json& j, const MountingRail& rail) {
    j = {
        {"id", rail.id},
        {"position", rail.position},
        {"length", rail.length},
        {"orientation", rail.orientation},
        {"max_modules", rail.max_modules}
    };
}

inline void from_json(const nlohmann::json& j, MountingRail& rail) {
    rail.id = j.at("id").get<std::string>();
    rail.position = j.at("position").get<Vec3>();
    rail.length = j.at("length").get<float>();
    rail.orientation = j.value("orientation", RailOrientation::Horizontal);
    rail.max_modules = j.value("max_modules", 0u);
}

inline void to_json(nlohmann::json& j, const Enclosure& enclosure) {
    j = {
        {"id", enclosure.id},
        {"width", enclosure.width},
        {"height", enclosure.height},
        {"depth", enclosure.depth},
        {"origin", enclosure.origin},
        {"rails", enclosure.rails}
    };
}

inline void from_json(const nlohmann::json& j, Enclosure& enclosure) {
    enclosure.id = j.value("id", "panel-1");
    enclosure.width = j.at("width").get<float>();
    enclosure.height = j.at("height").get<float>();
    enclosure.depth = j.at("depth").get<float>();
    enclosure.origin = j.contains("origin") ? j["origin"].get<Vec3>() : vec3::zero();
    enclosure.rails = j.value("rails", std::vector<MountingRail>{});
}

// ComponentDefinition serialization
inline void to_json(nlohmann::json& j, const LogicalPin& pin) {
    j = {
        {"name", pin.name},
        {"type", pin.type},
        {"position", nlohmann::json::array({pin.u, pin.v})}
    };
}

inline void from_json(const nlohmann::json& j, LogicalPin& pin) {
    pin.name = j.at("name").get<std::string>();
    pin.type = j.at("type").get<PinType>();
    const auto& pos = j.at("position");
    pin.u = pos.at(0).get<float>();
    pin.v = pos.at(1).get<float>();
}

inline void to_json(nlohmann::json& j, const Dimensions& dims) {
    j = {
        {"width", dims.width},
        {"height", dims.height},
        {"depth", dims.depth},
        {"din_modules", dims.din_modules}
    };
}

inline void from_json(const nlohmann::json& j, Dimensions& dims) {
    dims.width = j.at("width").get<float>();
    dims.height = j.at("height").get<float>();
    dims.depth = j.at("depth").get<float>();
    dims.din_modules = j.value("din_modules", 0.0f);
}

inline void to_json(nlohmann::json& j, const ComponentDefinition& def) {
    j = {
        {"id", def.id},
        {"type", def.type},
        {"manufacturer", def.manufacturer},
        {"model_number", def.model_number},
        {"display_name", def.display_name},
        {"dimensions", def.dimensions},
        {"pins", def.pins}
    };
}

inline void from_json(const nlohmann::json& j, ComponentDefinition& def) {
    def.id = j.at("id").get<std::string>();
    def.type = j.at("type").get<ComponentType>();
    def.manufacturer = j.value("manufacturer", "");
    def.model_number = j.value("model_number", "");
    def.display_name = j.value("display_name", def.id);
    def.dimensions = j.at("dimensions").get<Dimensions>();
    def.pins = j.value("pins", std::vector<LogicalPin>{});
}

// ComponentInstance serialization. Pins are written for exporters but
// rebuilt from the definition on load.
inline void to_json(nlohmann::json& j, const ComponentInstance& inst) {
    j = {
        {"id", inst.id},
        {"definition_id", inst.definition_id},
        {"label", inst.label},
        {"schematic_position", inst.schematic_position},
        {"physical_position", inst.physical_position},
        {"physically_placed", inst.physically_placed}
    };
    if (inst.rail_slot) j["rail_slot"] = *inst.rail_slot;
    if (inst.rail_id) j["rail_id"] = *inst.rail_id;

    nlohmann::json pins = nlohmann::json::array();
    for (const auto& pin : inst.pins) {
        pins.push_back({{"name", pin.name}, {"type", pin.type}, {"world", pin.world}});
    }
    j["pins"] = pins;
}

inline void from_json(const nlohmann::json& j, ComponentInstance& inst) {
    inst.id = j.at("id").get<std::string>();
    inst.definition_id = j.at("definition_id").get<std::string>();
    inst.label = j.value("label", inst.id);
    inst.schematic_position = j.contains("schematic_position")
        ? j["schematic_position"].get<Vec2>() : Vec2{};
    inst.physical_position = j.contains("physical_position")
        ? j["physical_position"].get<Vec3>() : vec3::zero();
    inst.physically_placed = j.value("physically_placed", false);
    if (j.contains("rail_slot")) inst.rail_slot = j["rail_slot"].get<uint32_t>();
    if (j.contains("rail_id")) inst.rail_id = j["rail_id"].get<std::string>();
    inst.pins.clear();
}

// PinRef / LogicalConnection serialization
inline void to_json(nlohmann::json& j, const PinRef& ref) {
    j = ref.to_string();
}

inline void from_json(const nlohmann::json& j, PinRef& ref) {
    auto parsed = PinRef::parse(j.get<std::string>());
    if (!parsed) throw std::invalid_argument("malformed pin reference: " + j.get<std::string>());
    ref = *parsed;
}

inline void to_json(nlohmann::json& j, const LogicalConnection& conn) {
    j = {
        {"id", conn.id},
        {"from", conn.from},
        {"to", conn.to},
        {"wire_type", conn.wire_type}
    };
    if (conn.label) j["label"] = *conn.label;
}

inline void from_json(const nlohmann::json& j, LogicalConnection& conn) {
    conn.id = j.at("id").get<std::string>();
    conn.from = j.at("from").get<PinRef>();
    conn.to = j.at("to").get<PinRef>();
    conn.wire_type = j.at("wire_type").get<WireType>();
    if (j.contains("label")) {
        conn.label = j["label"].get<std::string>();
    } else {
        conn.label.reset();
    }
}

// Wire serialization
inline void to_json(nlohmann::json& j, const Waypoint& wp) {
    j = {{"position", wp.position}, {"user_anchored", wp.user_anchored}};
}

inline void from_json(const nlohmann::json& j, Waypoint& wp) {
    wp.position = j.at("position").get<Vec3>();
    wp.user_anchored = j.value("user_anchored", false);
}

inline void to_json(nlohmann::json& j, const Wire& wire) {
    j = {
        {"id", wire.id},
        {"connection_id", wire.connection_id},
        {"wire_type", wire.wire_type},
        {"color", wire.color},
        {"thickness", wire.thickness},
        {"method", wire.method},
        {"waypoints", wire.waypoints}
    };
    if (wire.length) j["length"] = *wire.length;
}

inline void from_json(const nlohmann::json& j, Wire& wire) {
    wire.id = j.at("id").get<std::string>();
    wire.connection_id = j.at("connection_id").get<std::string>();
    wire.wire_type = j.value("wire_type", WireType::Signal);
    wire.color = wire_color(wire.wire_type);
    wire.thickness = j.value("thickness", 2.0f);
    wire.method = j.value("method", RoutingMethod::Manhattan);
    wire.set_waypoints(j.value("waypoints", std::vector<Waypoint>{}));
}

// Snapshot serialization
inline nlohmann::json snapshot_to_json(const Snapshot& snapshot) {
    nlohmann::json j;
    j["enclosure"] = snapshot.enclosure;
    j["library"] = snapshot.library;
    j["instances"] = snapshot.instances;
    j["connections"] = snapshot.connections;
    j["wires"] = snapshot.wires;
    j["counters"] = {
        {"instance", snapshot.next_instance},
        {"connection", snapshot.next_connection},
        {"wire", snapshot.next_wire}
    };
    return j;
}

// Throws SnapshotError on malformed input
inline Snapshot snapshot_from_json(const nlohmann::json& j) {
    try {
        Snapshot snapshot;
        snapshot.enclosure = j.at("enclosure").get<Enclosure>();
        snapshot.library = j.value("library", std::vector<ComponentDefinition>{});
        snapshot.instances = j.value("instances", std::vector<ComponentInstance>{});
        snapshot.connections = j.value("connections", std::vector<LogicalConnection>{});
        snapshot.wires = j.value("wires", std::vector<Wire>{});
        if (j.contains("counters")) {
            const auto& counters = j["counters"];
            snapshot.next_instance = counters.value("instance", uint64_t{1});
            snapshot.next_connection = counters.value("connection", uint64_t{1});
            snapshot.next_wire = counters.value("wire", uint64_t{1});
        }
        return snapshot;
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError(e.what());
    } catch (const std::invalid_argument& e) {
        throw SnapshotError(e.what());
    }
}

}  // namespace panelroute

#endif // PANELROUTE_SERIALIZATION_PANEL_JSON_HPP
