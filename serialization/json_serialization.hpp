#ifndef EDGEARC_SERIALIZATION_JSON_SERIALIZATION_HPP
#define EDGEARC_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace edgearc::json {

// Version of the serialization format
constexpr const char* SERIALIZATION_VERSION = "1.0.0";

// Metadata wrapper for serialized data
struct SerializedData {
    std::string version = SERIALIZATION_VERSION;
    std::string step;
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

    // An object carrying a "data" member is an envelope. Anything else is
    // taken as bare data, so hand-written edge lists load directly.
    static SerializedData from_json(const nlohmann::json& j) {
        SerializedData result;
        if (!j.is_object() || !j.contains("data")) {
            result.version = "none";
            result.step = "input";
            result.data = j;
            return result;
        }
        result.version = j.value("version", "unknown");
        result.step = j.value("step", "unknown");
        result.timestamp = j.value("timestamp", "");
        result.source_file = j.value("source_file", "");
        if (j.contains("config")) result.config = j["config"];
        if (j.contains("stats")) result.stats = j["stats"];
        result.data = j["data"];
        return result;
    }
};

// Get current timestamp in ISO 8601 format
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Write JSON to file, "-" writes to stdout
inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    if (path == "-") {
        std::cout << j.dump(2) << "\n";
        return;
    }
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);
}

// Read JSON from file, "-" reads stdin
inline nlohmann::json read_json_file(const std::string& path) {
    if (path == "-") {
        return nlohmann::json::parse(std::cin);
    }
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    return nlohmann::json::parse(file);
}

inline void write_serialized(const std::string& path, const SerializedData& data) {
    write_json_file(path, data.to_json());
}

inline SerializedData read_serialized(const std::string& path) {
    SerializedData data = SerializedData::from_json(read_json_file(path));
    if (data.source_file.empty() && path != "-") {
        data.source_file = path;
    }
    return data;
}

}  // namespace edgearc::json

#endif // EDGEARC_SERIALIZATION_JSON_SERIALIZATION_HPP
