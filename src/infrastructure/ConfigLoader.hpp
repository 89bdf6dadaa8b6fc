/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving engine configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place instead of scattering it
 * through the codebase.
 */

#pragma once

#include <string>
#include "domain/EngineConfig.hpp"

namespace lextable::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json into an EngineConfig.
     * @param path Path to the settings file.
     * @return Defaults when the file is missing. Keys that are malformed keep their default.
     */
    static domain::EngineConfig Load(const std::string& path);

    /**
     * @brief Writes the config to path, preserving keys this version does not know.
     * @return false when the file could not be written.
     */
    static bool Save(const std::string& path, const domain::EngineConfig& config);
};

} // namespace lextable::infrastructure
