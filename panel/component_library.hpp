#ifndef PANELROUTE_PANEL_COMPONENT_LIBRARY_HPP
#define PANELROUTE_PANEL_COMPONENT_LIBRARY_HPP

#include "component_definition.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace panelroute {

// Catalog of component definitions, keyed by definition id.
// Definitions keep their insertion order.
class ComponentLibrary {
public:
    ComponentLibrary() = default;
    explicit ComponentLibrary(std::vector<ComponentDefinition> definitions);

    // Adds a definition; returns false (and keeps the existing entry) if the
    // id is already present.
    bool add(const ComponentDefinition& definition);

    const ComponentDefinition* find(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }

    size_t size() const { return definitions_.size(); }
    const std::vector<ComponentDefinition>& definitions() const { return definitions_; }

    // Common DIN rail devices: breakers, contactor, relay, PLC, PSU, terminal
    static ComponentLibrary standard();

private:
    std::vector<ComponentDefinition> definitions_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace panelroute

#endif // PANELROUTE_PANEL_COMPONENT_LIBRARY_HPP
