/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the render configuration (settings.json).
 *
 * Keeps JSON parsing of options in one place so the rest of the code base
 * only ever sees the typed RenderConfig record.
 */

#pragma once

#include "domain/RenderConfig.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace systemviz::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads a settings file on top of the defaults.
     * @param settingsPath Path to a JSON object; a missing file yields the defaults.
     * @return The configuration, or nullopt if the file is malformed (reason logged).
     */
    static std::optional<domain::RenderConfig> LoadFromFile(const std::filesystem::path& settingsPath);

    /**
     * @brief Applies the keys present in @p j onto @p config.
     * @throws nlohmann::json::exception / std::invalid_argument on wrong types or values.
     */
    static void Apply(const nlohmann::json& j, domain::RenderConfig& config);

    /** @brief Serializes every field, e.g. to bootstrap a settings file. */
    static nlohmann::json ToJson(const domain::RenderConfig& config);

    /**
     * @brief Saves the configuration as pretty-printed JSON.
     * @return True on success.
     */
    static bool Save(const std::filesystem::path& settingsPath, const domain::RenderConfig& config);

    /** @brief Resolves concurrency 0 to the host processing-unit count (at least 1). */
    static unsigned EffectiveConcurrency(const domain::RenderConfig& config);
};

} // namespace systemviz::infrastructure
