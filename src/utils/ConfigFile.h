#pragma once

#include "../core/ConversionConfig.h"

#include <nlohmann/json.hpp>

namespace Webpify
{
    /**
     * @brief Optional JSON configuration file.
     *
     * Recognized keys (all optional, unknown keys are ignored):
     * @code
     * {
     *   "path": "photos", "output": "out", "quality": 75,
     *   "mime_types": ["jpeg", "png"], "skip_types": ["webp"],
     *   "delete": false, "target": "webp", "jobs": 4, "verbose": true
     * }
     * @endcode
     */
    class ConfigFile
    {
    public:
        /**
         * @brief Reads @p path and overrides the matching fields of @p config.
         * @throws ConfigError if the file cannot be read, is not valid JSON or
         *         holds a value of the wrong type.
         */
        static void load(const fs::path& path, ConversionConfig& config);

        /**
         * @brief Applies an already parsed JSON object to @p config.
         * @throws ConfigError on type mismatches.
         */
        static void apply(const nlohmann::json& json, ConversionConfig& config);
    };

} // namespace Webpify
