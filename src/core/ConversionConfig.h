#pragma once
#include "ImageFormat.h"
#include "../utils/Definitions.h"

#include <set>

namespace Webpify
{
    /**
     * @brief Settings for one batch run, filled in from defaults, an optional
     * JSON config file and the command line (in that order of precedence).
     */
    struct ConversionConfig
    {
        std::string inputPath = Definitions::DEFAULT_INPUT_PATH;
        std::string outputPath = Definitions::DEFAULT_OUTPUT_PATH;
        int quality = Definitions::DEFAULT_QUALITY;
        std::vector<std::string> mimeTypes = Definitions::DEFAULT_MIME_TYPES;
        std::vector<std::string> skipTypes = Definitions::DEFAULT_SKIP_TYPES;
        bool deleteOriginal = false;
        std::string targetFormat = Definitions::DEFAULT_TARGET_FORMAT;
        unsigned int jobs = Definitions::DEFAULT_JOBS;
        bool verbose = false;

        /**
         * @brief Checks the quality range and every format name.
         * @throws ConfigError describing the first invalid setting.
         */
        void validate() const;

        /// @throws ConfigError for an unknown target name.
        FormatTag resolvedTarget() const;

        /// @throws ConfigError for an unknown format name.
        std::set<FormatTag> resolvedMimeTypes() const;
        std::set<FormatTag> resolvedSkipTypes() const;
    };

} // namespace Webpify
