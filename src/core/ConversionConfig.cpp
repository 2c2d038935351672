#include "ConversionConfig.h"

namespace Webpify
{
    namespace
    {
        std::string knownFormats()
        {
            std::string names;
            for (const auto& info : ImageFormat::table()) {
                if (!names.empty()) names += ", ";
                names += info.aliases.front();
            }
            return names;
        }

        FormatTag resolve(const std::string& name, const std::string& option)
        {
            auto tag = ImageFormat::normalize(name);
            if (!tag) {
                throw ConfigError("Unknown image format '" + name + "' for " + option +
                                  " (known: " + knownFormats() + ")");
            }
            return *tag;
        }

        std::set<FormatTag> resolveAll(const std::vector<std::string>& names, const std::string& option)
        {
            std::set<FormatTag> tags;
            for (const auto& name : names) {
                if (name.empty()) continue;
                tags.insert(resolve(name, option));
            }
            return tags;
        }
    }

    void ConversionConfig::validate() const
    {
        if (quality < Definitions::MIN_QUALITY || quality > Definitions::MAX_QUALITY) {
            throw ConfigError("Quality must be between " + std::to_string(Definitions::MIN_QUALITY) +
                              " and " + std::to_string(Definitions::MAX_QUALITY) +
                              ", got " + std::to_string(quality));
        }
        if (inputPath.empty()) throw ConfigError("Input path must not be empty");
        if (outputPath.empty()) throw ConfigError("Output path must not be empty");

        resolvedTarget();
        resolvedMimeTypes();
        resolvedSkipTypes();
    }

    FormatTag ConversionConfig::resolvedTarget() const
    {
        return resolve(targetFormat, "--target");
    }

    std::set<FormatTag> ConversionConfig::resolvedMimeTypes() const
    {
        return resolveAll(mimeTypes, "--mime-types");
    }

    std::set<FormatTag> ConversionConfig::resolvedSkipTypes() const
    {
        return resolveAll(skipTypes, "--skip-types");
    }

} // namespace Webpify
