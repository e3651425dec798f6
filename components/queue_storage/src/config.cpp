/**
 * @file config.cpp
 * @brief Implementation of the configuration utilities
 */

#include "queue_storage/config.hpp"

#include <fstream>
#include <spdlog/spdlog.h>

namespace queue_storage {

namespace {

// nlohmann converts negative integers to size_t without complaint
size_t getNonNegative(const nlohmann::json& json, const std::string& key) {
    int64_t value = json[key].get<int64_t>();
    if (value < 0) {
        throw ConfigError(key + " must not be negative");
    }
    return static_cast<size_t>(value);
}

} // namespace

StorageConfig Config::loadStorageConfig(const std::string& filepath) {
    nlohmann::json json = loadJsonFromFile(filepath);
    StorageConfig config = parseStorageConfig(json);
    spdlog::info("Loaded storage configuration from {}", filepath);
    return config;
}

StorageConfig Config::parseStorageConfig(const nlohmann::json& json) {
    StorageConfig config;

    if (!json.is_object()) {
        throw ConfigError("root must be a JSON object");
    }

    if (json.contains("storage")) {
        const auto& storageJson = json["storage"];

        if (!storageJson.is_object()) {
            throw ConfigError("\"storage\" must be a JSON object");
        }

        try {
            if (storageJson.contains("backend")) {
                config.backend = storageJson["backend"].get<std::string>();
            }

            if (storageJson.contains("maxQueueDepth")) {
                config.maxQueueDepth = getNonNegative(storageJson, "maxQueueDepth");
            }

            if (storageJson.contains("maxDestinationLength")) {
                config.maxDestinationLength = getNonNegative(storageJson, "maxDestinationLength");
            }

            if (storageJson.contains("messageIdPrefix")) {
                config.messageIdPrefix = storageJson["messageIdPrefix"].get<std::string>();
            }

            if (storageJson.contains("enableMetrics")) {
                config.enableMetrics = storageJson["enableMetrics"].get<bool>();
            }

            if (storageJson.contains("idleQueueTimeoutMs")) {
                config.idleQueueTimeout =
                    std::chrono::milliseconds(storageJson["idleQueueTimeoutMs"].get<int64_t>());
            }
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("invalid storage setting: " + std::string(e.what()));
        }
    }

    std::string error = validate(config);
    if (!error.empty()) {
        throw ConfigError(error);
    }

    return config;
}

nlohmann::json Config::toJson(const StorageConfig& config) {
    return nlohmann::json{
        {"storage", {
            {"backend", config.backend},
            {"maxQueueDepth", config.maxQueueDepth},
            {"maxDestinationLength", config.maxDestinationLength},
            {"messageIdPrefix", config.messageIdPrefix},
            {"enableMetrics", config.enableMetrics},
            {"idleQueueTimeoutMs", config.idleQueueTimeout.count()}
        }}
    };
}

nlohmann::json Config::loadJsonFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigError("failed to open configuration file: " + filepath);
    }

    try {
        nlohmann::json json;
        file >> json;
        return json;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("failed to parse configuration file: " + std::string(e.what()));
    }
}

} // namespace queue_storage
