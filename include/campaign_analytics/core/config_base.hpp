// include/campaign_analytics/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "campaign_analytics/core/error.hpp"

namespace campaign_analytics {

/**
 * @brief Base class for all configuration types
 * Provides common serialization and deserialization methods
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to the file
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * Missing keys keep their current values.
     */
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Check the loaded values
     * @return Result indicating whether the configuration is usable
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }
};

}  // namespace campaign_analytics
