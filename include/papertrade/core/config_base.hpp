// include/papertrade/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "papertrade/core/error.hpp"

namespace papertrade {

/**
 * @brief Base class for all configuration types
 * Provides JSON file persistence on top of to_json/from_json
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
     * @brief Load configuration from JSON file and validate it
     * @param filepath Path to the file
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Convert configuration to JSON
     */
    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * Missing keys keep their current values
     */
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Check the loaded values for consistency
     * @return Error with INVALID_CONFIGURATION when values are unusable
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }
};

}  // namespace papertrade
