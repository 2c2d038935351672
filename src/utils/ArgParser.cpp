#include "ArgParser.h"
#include "ConfigFile.h"
#include "Definitions.h"

namespace def = Definitions;

namespace Webpify
{

namespace {

std::string joinDefaults(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) joined += ",";
        joined += value;
    }
    return joined;
}

} // namespace

ArgParser::ArgParser()
    : m_options("webpify", "Convert images to WebP format using multiple threads.")
{
    m_options.positional_help("[path]");
    m_options.add_options()
        ("path", "Path to the directory containing images",
            cxxopts::value<std::string>()->default_value(def::DEFAULT_INPUT_PATH))
        ("o,output", "Output directory for converted images",
            cxxopts::value<std::string>()->default_value(def::DEFAULT_OUTPUT_PATH))
        ("q,quality", "Quality of the converted images (0-100)",
            cxxopts::value<int>()->default_value(std::to_string(def::DEFAULT_QUALITY)))
        ("m,mime-types", "Image formats to convert (comma separated or repeated)",
            cxxopts::value<std::vector<std::string>>()->default_value(joinDefaults(def::DEFAULT_MIME_TYPES)))
        ("s,skip-types", "Image formats to skip (comma separated or repeated)",
            cxxopts::value<std::vector<std::string>>()->default_value(joinDefaults(def::DEFAULT_SKIP_TYPES)))
        ("delete", "Delete original files after conversion")
        ("t,target", "Format to convert the images to",
            cxxopts::value<std::string>()->default_value(def::DEFAULT_TARGET_FORMAT))
        ("j,jobs", "Number of worker threads (0 = one per CPU)",
            cxxopts::value<unsigned int>()->default_value(std::to_string(def::DEFAULT_JOBS)))
        ("c,config", "JSON configuration file", cxxopts::value<std::string>())
        ("v,verbose", "Log every file as it is processed")
        ("h,help", "Display this help menu");
    m_options.parse_positional({"path"});
}

std::string ArgParser::help() const {
    return m_options.help();
}

ArgParser::Arguments ArgParser::parseArgs(int argc, char** argv) {
    Arguments args;

    try {
        auto result = m_options.parse(argc, argv);

        if (result.count("help")) {
            args.helpRequested = true;
            return args;
        }

        if (result.count("config")) {
            args.configFile = result["config"].as<std::string>();
            ConfigFile::load(args.configFile, args.config);
        }

        mapResults(result, args.config);

    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& e) {
        // cxxopts reports unknown options and bad values through its own exception types
        throw ConfigError(std::string("Error parsing arguments: ") + e.what());
    }

    return args;
}

void ArgParser::mapResults(const cxxopts::ParseResult& result, ConversionConfig& config) const {
    // Only explicit options override values that may have come from the config file
    if (result.count("path")) config.inputPath = result["path"].as<std::string>();
    if (result.count("output")) config.outputPath = result["output"].as<std::string>();
    if (result.count("quality")) config.quality = result["quality"].as<int>();
    if (result.count("mime-types")) config.mimeTypes = result["mime-types"].as<std::vector<std::string>>();
    if (result.count("skip-types")) config.skipTypes = result["skip-types"].as<std::vector<std::string>>();
    if (result.count("delete")) config.deleteOriginal = result["delete"].as<bool>();
    if (result.count("target")) config.targetFormat = result["target"].as<std::string>();
    if (result.count("jobs")) config.jobs = result["jobs"].as<unsigned int>();
    if (result.count("verbose")) config.verbose = result["verbose"].as<bool>();
}

} // namespace Webpify
