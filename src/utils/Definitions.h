#ifndef WEBPIFY_DEFINITIONS_H
#define WEBPIFY_DEFINITIONS_H

#include <string>
#include <vector>

namespace Definitions {

// --- Conversion defaults ---

const std::string DEFAULT_INPUT_PATH = ".";
const std::string DEFAULT_OUTPUT_PATH = ".";
const std::string DEFAULT_TARGET_FORMAT = "webp";

const int DEFAULT_QUALITY = 80;
const int MIN_QUALITY = 0;
const int MAX_QUALITY = 100;

// 0 selects std::thread::hardware_concurrency()
const unsigned int DEFAULT_JOBS = 0;

// Formats converted unless listed in the skip set
const std::vector<std::string> DEFAULT_MIME_TYPES = {
    "image/jpeg", "image/png", "image/gif"
};

const std::vector<std::string> DEFAULT_SKIP_TYPES = {
    "image/webp"
};

} // namespace Definitions

#endif // WEBPIFY_DEFINITIONS_H
