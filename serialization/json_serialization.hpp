#ifndef PANELROUTE_SERIALIZATION_JSON_SERIALIZATION_HPP
#define PANELROUTE_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace panelroute::json {

// Version of the project file format
constexpr const char* SERIALIZATION_VERSION = "1.0.0";

// Same major component as SERIALIZATION_VERSION
inline bool compatible_version(const std::string& version) {
    const std::string current = SERIALIZATION_VERSION;
    return version.substr(0, version.find('.')) == current.substr(0, current.find('.'));
}

// Envelope around every file the tools read or write
struct SerializedData {
    std::string version = SERIALIZATION_VERSION;
    std::string step;               // "project", "routed", "library"
    std::string timestamp;
    std::string source_file;
    nlohmann::json config;
    nlohmann::json stats;
    nlohmann::json data;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["version"] = version;
        j["step"] = step;
        if (!timestamp.empty()) j["timestamp"] = timestamp;
        if (!source_file.empty()) j["source_file"] = source_file;
        if (!config.is_null()) j["config"] = config;
        if (!stats.is_null()) j["stats"] = stats;
        j["data"] = data;
        return j;
    }

    // Throws std::runtime_error if the "data" member is missing or the file
    // was written by an incompatible major format version
    static SerializedData from_json(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("data")) {
            throw std::runtime_error("Serialized file has no 'data' member");
        }
        SerializedData result;
        result.version = j.value("version", SERIALIZATION_VERSION);
        if (!compatible_version(result.version)) {
            throw std::runtime_error("Unsupported file format version " + result.version +
                                     " (expected " + SERIALIZATION_VERSION + ")");
        }
        result.step = j.value("step", "unknown");
        result.timestamp = j.value("timestamp", "");
        result.source_file = j.value("source_file", "");
        if (j.contains("config")) result.config = j["config"];
        if (j.contains("stats")) result.stats = j["stats"];
        result.data = j["data"];
        return result;
    }
};

// Current time in ISO 8601 format
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

inline void write_serialized(const std::string& path, const SerializedData& data) {
    write_json_file(path, data.to_json());
}

inline SerializedData read_serialized(const std::string& path) {
    return SerializedData::from_json(read_json_file(path));
}

}  // namespace panelroute::json

#endif // PANELROUTE_SERIALIZATION_JSON_SERIALIZATION_HPP
