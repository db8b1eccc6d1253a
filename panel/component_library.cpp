#include "component_library.hpp"

namespace panelroute {

ComponentLibrary::ComponentLibrary(std::vector<ComponentDefinition> definitions) {
    for (auto& def : definitions) {
        add(def);
    }
}

bool ComponentLibrary::add(const ComponentDefinition& definition) {
    if (index_.count(definition.id)) {
        return false;
    }
    index_[definition.id] = definitions_.size();
    definitions_.push_back(definition);
    return true;
}

const ComponentDefinition* ComponentLibrary::find(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &definitions_[it->second];
}

namespace {

ComponentDefinition make_definition(std::string id, ComponentType type,
                                    std::string manufacturer, std::string model,
                                    std::string display_name, Dimensions dims,
                                    std::vector<LogicalPin> pins) {
    ComponentDefinition def;
    def.id = std::move(id);
    def.type = type;
    def.manufacturer = std::move(manufacturer);
    def.model_number = std::move(model);
    def.display_name = std::move(display_name);
    def.dimensions = dims;
    def.pins = std::move(pins);
    return def;
}

}  // namespace

ComponentLibrary ComponentLibrary::standard() {
    ComponentLibrary library;

    library.add(make_definition(
        "siemens-5sy6-116-7", ComponentType::MCB, "Siemens", "5SY6 116-7",
        "MCB 16A 1P", {17.5f, 85.0f, 70.0f, 1.0f},
        {{"L1", PinType::Power, 0.0f, 0.2f},
         {"OUT", PinType::Output, 1.0f, 0.2f}}));

    library.add(make_definition(
        "schneider-a9f74332", ComponentType::MCB, "Schneider Electric", "A9F74332",
        "MCB 32A 3P", {52.5f, 85.0f, 70.0f, 3.0f},
        {{"L1", PinType::Power, 0.0f, 0.2f},
         {"L2", PinType::Power, 0.0f, 0.4f},
         {"L3", PinType::Power, 0.0f, 0.6f},
         {"OUT1", PinType::Output, 1.0f, 0.2f},
         {"OUT2", PinType::Output, 1.0f, 0.4f},
         {"OUT3", PinType::Output, 1.0f, 0.6f}}));

    library.add(make_definition(
        "abb-a9-30-10", ComponentType::Contactor, "ABB", "A9-30-10",
        "Contactor 25A", {45.0f, 78.0f, 85.0f, 2.5f},
        {{"A1", PinType::Input, 0.0f, 0.15f},
         {"A2", PinType::Input, 0.0f, 0.25f},
         {"L1", PinType::Power, 0.0f, 0.5f},
         {"L2", PinType::Power, 0.0f, 0.6f},
         {"L3", PinType::Power, 0.0f, 0.7f},
         {"T1", PinType::Output, 1.0f, 0.5f},
         {"T2", PinType::Output, 1.0f, 0.6f},
         {"T3", PinType::Output, 1.0f, 0.7f}}));

    library.add(make_definition(
        "finder-55-34-8-230", ComponentType::Relay, "Finder", "55.34.8.230",
        "Relay 7A 4PDT", {17.5f, 90.0f, 64.0f, 1.0f},
        {{"A1", PinType::Input, 0.0f, 0.3f},
         {"A2", PinType::Input, 0.0f, 0.4f},
         {"11", PinType::Input, 0.0f, 0.6f},
         {"12", PinType::Output, 1.0f, 0.6f},
         {"14", PinType::Output, 1.0f, 0.7f}}));

    library.add(make_definition(
        "siemens-s7-1200-cpu1211c", ComponentType::PLC, "Siemens", "6ES7211-1AE40-0XB0",
        "PLC S7-1200", {90.0f, 100.0f, 75.0f, 5.0f},
        {{"DI0", PinType::Input, 0.0f, 0.2f},
         {"DI1", PinType::Input, 0.0f, 0.3f},
         {"DO0", PinType::Output, 1.0f, 0.2f},
         {"DO1", PinType::Output, 1.0f, 0.3f},
         {"24V", PinType::Power, 0.0f, 0.6f},
         {"GND", PinType::Ground, 0.0f, 0.7f}}));

    library.add(make_definition(
        "phoenix-quint-ps-100-240ac-24dc-10", ComponentType::PowerSupply,
        "Phoenix Contact", "QUINT-PS/1AC/24DC/10", "Power Supply 24VDC 10A",
        {70.0f, 125.0f, 125.0f, 4.0f},
        {{"L", PinType::Power, 0.0f, 0.3f},
         {"N", PinType::Neutral, 0.0f, 0.4f},
         {"PE", PinType::Ground, 0.0f, 0.5f},
         {"+24V", PinType::Output, 1.0f, 0.3f},
         {"0V", PinType::Output, 1.0f, 0.4f}}));

    library.add(make_definition(
        "wago-280-901", ComponentType::Terminal, "WAGO", "280-901",
        "Terminal Block 4mm2", {6.0f, 60.0f, 45.0f, 0.34f},
        {{"IN", PinType::Input, 0.0f, 0.5f},
         {"OUT", PinType::Output, 1.0f, 0.5f}}));

    return library;
}

}  // namespace panelroute
