#include "core/ImageFormatConverter.h"
#include "core/OpenCvCodec.h"
#include "utils/ArgParser.h"
#include "utils/Logger.h"

#include <iostream>

using namespace Webpify;

// Exit status: 0 = no per-file errors, 1 = at least one file failed,
// 2 = nothing ran (bad arguments, bad config or missing input path).
int main(int argc, char* argv[]) {
    ArgParser parser;
    ArgParser::Arguments args;

    try {
        args = parser.parseArgs(argc, argv);
    } catch (const ConfigError& e) {
        Logger::error(e.what());
        std::cerr << parser.help() << std::endl;
        return 2;
    }

    if (args.helpRequested) {
        std::cout << parser.help() << std::endl;
        return 0;
    }

    Logger::setVerbose(args.config.verbose);

    try {
        OpenCvCodec codec;
        BatchResult result = ImageFormatConverter::convertBatch(args.config, codec, std::cout);
        return result.report.errors > 0 ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
}
