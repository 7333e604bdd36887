#include "roadnet/config/ConfigSerializer.h"
#include "roadnet/common/Logger.h"
#include "roadnet/core/Errors.h"
#include "roadnet/core/Road.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace roadnet {

namespace {
constexpr int FORMAT_VERSION = 1;
}

std::string ConfigSerializer::toJson(const NetworkConfig& config) {
    json j;
    j["version"] = FORMAT_VERSION;
    j["identification"] = {
        {"extraLengths", config.identification.extraLengths},
        {"extraCharacters", config.identification.extraCharacters}
    };
    j["defaultSpeedLimit"] = config.defaultSpeedLimit;
    return j.dump(2);
}

NetworkConfig ConfigSerializer::fromJson(const std::string& jsonStr) {
    NetworkConfig config = NetworkConfig::createDefault();
    std::vector<int> lengths;

    try {
        json j = json::parse(jsonStr);

        int version = j.value("version", FORMAT_VERSION);
        if (version != FORMAT_VERSION) {
            throw std::runtime_error("Unsupported NetworkConfig version: " + std::to_string(version));
        }

        if (j.contains("identification")) {
            const auto& rules = j["identification"];
            lengths = rules.value("extraLengths", std::vector<int>{});
            config.identification.allowCharacters(rules.value("extraCharacters", std::string{}));
        }
        config.defaultSpeedLimit = j.value("defaultSpeedLimit", NetworkConfig::DEFAULT_SPEED_LIMIT);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse NetworkConfig JSON: ") + e.what());
    }

    config.identification.allowLengths(lengths);
    if (!road::isValidSpeedLimit(config.defaultSpeedLimit)) {
        throw InvalidSpeedLimitError(config.defaultSpeedLimit);
    }
    return config;
}

bool ConfigSerializer::saveToFile(const NetworkConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open {} for writing", path);
        return false;
    }
    file << toJson(config);
    return true;
}

NetworkConfig ConfigSerializer::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open NetworkConfig file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

}  // namespace roadnet
