#include "ConfigFile.h"

#include <fstream>

using json = nlohmann::json;

namespace Webpify
{
    void ConfigFile::load(const fs::path& path, ConversionConfig& config)
    {
        std::ifstream file(path);
        if (!file) {
            throw ConfigError("Cannot open config file '" + path.string() + "'");
        }

        json parsed;
        try {
            parsed = json::parse(file);
        } catch (const json::parse_error& e) {
            throw ConfigError("Invalid JSON in config file '" + path.string() + "': " + e.what());
        }
        apply(parsed, config);
    }

    void ConfigFile::apply(const json& config_json, ConversionConfig& config)
    {
        if (!config_json.is_object()) {
            throw ConfigError("Config file must contain a JSON object");
        }

        try {
            config.inputPath = config_json.value("path", config.inputPath);
            config.outputPath = config_json.value("output", config.outputPath);
            config.quality = config_json.value("quality", config.quality);
            config.deleteOriginal = config_json.value("delete", config.deleteOriginal);
            config.targetFormat = config_json.value("target", config.targetFormat);
            config.verbose = config_json.value("verbose", config.verbose);

            if (config_json.contains("mime_types")) {
                config.mimeTypes = config_json["mime_types"].get<std::vector<std::string>>();
            }
            if (config_json.contains("skip_types")) {
                config.skipTypes = config_json["skip_types"].get<std::vector<std::string>>();
            }
            if (config_json.contains("jobs")) {
                const json& jobs = config_json["jobs"];
                if (!jobs.is_number_integer() || jobs.get<long long>() < 0) {
                    throw ConfigError("'jobs' must be a non-negative integer");
                }
                config.jobs = jobs.get<unsigned int>();
            }
        } catch (const json::exception& e) {
            throw ConfigError(std::string("Invalid value in config file: ") + e.what());
        }
    }

} // namespace Webpify
