/**
 * @file config_loader.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <string>

#include "autooffset/config/config_models.hpp"

namespace aof {

/**
 * @brief Loads AppConfig from a flat JSON document.
 *
 * Expected shape: a "gauge" object, a "machines" array, a "tools" array and
 * top-level scalars. Objects must not nest. Absent keys keep the values of
 * AppConfig::defaults(); present arrays replace the default lists.
 */
class ConfigurationLoader {
public:
    static bool loadFromJsonFile(const std::string& filePath, AppConfig& outConfig, std::string& outError);
    static bool loadFromJsonString(const std::string& json, AppConfig& outConfig, std::string& outError);
};

} // namespace aof
