#ifndef WEBPIFY_ARG_PARSER_H
#define WEBPIFY_ARG_PARSER_H

#include <string>
#include "../core/ConversionConfig.h"
#include "cxxopts.hpp" // Requires cxxopts dependency

namespace Webpify
{

/**
 * @brief Parses the webpify command line into a ConversionConfig using cxxopts.
 */
class ArgParser {
public:
    /**
     * @brief Result of parsing: the merged configuration or a help request.
     */
    struct Arguments {
        ConversionConfig config;
        std::string configFile;      ///< Value of --config, empty if not given
        bool helpRequested = false;
    };

    /**
     * @brief Declares all options.
     */
    ArgParser();

    /**
     * @brief Parses the raw command line arguments.
     *
     * Built-in defaults are overridden by the --config file, which in turn is
     * overridden by options given explicitly on the command line.
     *
     * @param argc The argument count.
     * @param argv The argument values.
     * @return The Arguments struct containing the parsed values.
     * @throws ConfigError on unknown options, malformed values or an unreadable config file.
     */
    Arguments parseArgs(int argc, char** argv);

    /**
     * @brief Formatted help text for all options.
     */
    std::string help() const;

private:
    cxxopts::Options m_options;

    /**
     * @brief Copies every explicitly given option from @p result into @p config.
     */
    void mapResults(const cxxopts::ParseResult& result, ConversionConfig& config) const;
};

} // namespace Webpify

#endif // WEBPIFY_ARG_PARSER_H
