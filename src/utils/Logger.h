#pragma once

#include <string>

/**
 * @brief Console logging shared by the CLI and the worker threads.
 *
 * Every call writes one complete line under a single mutex, so lines from
 * concurrent workers never interleave mid-line. Their relative order is
 * unspecified.
 *
 * Usage:
 *   Logger::setVerbose(true);
 *   Logger::info("Scanning for image files...");
 *   Logger::warn("Failed to load " + path);
 */
namespace Logger {

// Enables debug() output
void setVerbose(bool verbose);
bool isVerbose();

// stdout
void info(const std::string& message);

// stdout, only when verbose
void debug(const std::string& message);

// stderr, prefixed with "Warning: "
void warn(const std::string& message);

// stderr, prefixed with "ERROR: "
void error(const std::string& message);

} // namespace Logger
