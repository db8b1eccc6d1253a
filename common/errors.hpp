#ifndef PANELROUTE_COMMON_ERRORS_HPP
#define PANELROUTE_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace panelroute {

// Caller-contract violations. Expected routing outcomes (out of bounds,
// no path, search limit) are reported as values, never thrown.

// Malformed enclosure dimensions, resolution or clearance for grid building
class InvalidGridParameters : public std::invalid_argument {
public:
    explicit InvalidGridParameters(const std::string& what)
        : std::invalid_argument("invalid grid parameters: " + what) {}
};

// Enclosure whose rails lie outside its volume
class InvalidEnclosure : public std::invalid_argument {
public:
    explicit InvalidEnclosure(const std::string& what)
        : std::invalid_argument("invalid enclosure: " + what) {}
};

// Definition whose id is already in the library with a different layout
class DefinitionConflict : public std::invalid_argument {
public:
    explicit DefinitionConflict(const std::string& id)
        : std::invalid_argument("definition '" + id + "' conflicts with the library entry") {}
};

class UnknownPin : public std::out_of_range {
public:
    explicit UnknownPin(const std::string& pin)
        : std::out_of_range("unknown pin: " + pin) {}
};

class UnknownComponent : public std::out_of_range {
public:
    explicit UnknownComponent(const std::string& id)
        : std::out_of_range("unknown component: " + id) {}
};

class UnknownConnection : public std::out_of_range {
public:
    explicit UnknownConnection(const std::string& id)
        : std::out_of_range("unknown connection: " + id) {}
};

class UnknownWire : public std::out_of_range {
public:
    explicit UnknownWire(const std::string& id)
        : std::out_of_range("unknown wire: " + id) {}
};

// Snapshot rejected during validation; the twin is left untouched
class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& what)
        : std::runtime_error("snapshot rejected: " + what) {}
};

}  // namespace panelroute

#endif // PANELROUTE_COMMON_ERRORS_HPP
