/**
 * @file config.hpp
 * @brief Configuration utilities for queue storage
 *
 * This file provides utilities for loading StorageConfig from JSON files.
 */

#pragma once

#include "queue_storage/types.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace queue_storage {

/**
 * @brief Exception thrown when configuration cannot be loaded or is invalid
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

/**
 * @brief Configuration utilities
 */
class Config {
public:
    /**
     * @brief Load storage configuration from JSON file
     * @param filepath Path to JSON configuration file
     * @return Storage configuration
     * @throws ConfigError if the file cannot be opened, parsed or validated
     */
    static StorageConfig loadStorageConfig(const std::string& filepath);

    /**
     * @brief Parse storage configuration from JSON
     *
     * Reads the optional top-level "storage" object. Missing fields keep
     * their defaults.
     *
     * @param json JSON object
     * @return Storage configuration
     * @throws ConfigError on type mismatches or invalid values
     */
    static StorageConfig parseStorageConfig(const nlohmann::json& json);

    /**
     * @brief Serialize a configuration back to JSON
     */
    static nlohmann::json toJson(const StorageConfig& config);

private:
    static nlohmann::json loadJsonFromFile(const std::string& filepath);
};

} // namespace queue_storage
