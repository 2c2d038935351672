#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <algorithm>
#include <stdexcept>
#include <cctype>
#include <system_error>

// --- C++ Namespace Setup ---

namespace fs = std::filesystem;

/**
 * @brief Global definitions and utilities for webpify.
 */
namespace Webpify
{
    /**
     * @brief Base exception for configuration, file system and codec errors.
     */
    class WebpifyException : public std::runtime_error {
    public:
        explicit WebpifyException(const std::string& message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief Raised when the input root is missing or is not a directory. Aborts the whole run.
     */
    class InputNotFoundError : public WebpifyException {
    public:
        explicit InputNotFoundError(const fs::path& path)
            : WebpifyException(describe(path)),
              m_path(path) {}

        const fs::path& path() const { return m_path; }

    private:
        static std::string describe(const fs::path& path) {
            std::error_code ec;
            if (fs::exists(path, ec)) {
                return "The input path " + path.string() + " is not a directory.";
            }
            return "The input path " + path.string() + " does not exist.";
        }

        fs::path m_path;
    };

    /**
     * @brief Raised for invalid command line arguments or configuration files.
     */
    class ConfigError : public WebpifyException {
    public:
        explicit ConfigError(const std::string& message)
            : WebpifyException(message) {}
    };

    /**
     * @brief Helper to convert a string to lowercase.
     */
    inline std::string to_lower(const std::string& str) {
        std::string data = str;
        std::transform(data.begin(), data.end(), data.begin(),
            [](unsigned char c){ return std::tolower(c); });
        return data;
    }

} // namespace Webpify
