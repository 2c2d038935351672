#include "FileSystemTool.h"
#include "../utils/Logger.h"

#include <fstream>
#include <functional>
#include <iterator>
#include <system_error>
#include <thread>

namespace Webpify
{
    // === FileSystemTool Implementation ===

    fs::path FileSystemTool::toAbsolutePath(const fs::path& path)
    {
        std::error_code ec;
        fs::path absolute = fs::absolute(path, ec);
        if (ec) return path.lexically_normal();
        return absolute.lexically_normal();
    }

    void FileSystemTool::ensureDirectory(const fs::path& directory)
    {
        if (directory.empty()) return;

        std::error_code ec;
        bool created = fs::create_directories(directory, ec);
        if (ec)
        {
            // Another worker may have created it between our check and mkdir
            std::error_code statEc;
            if (fs::is_directory(directory, statEc)) return;
            throw WebpifyException("Could not create directory: " + directory.string() + ". Reason: " + ec.message());
        }
        if (created)
        {
            Logger::debug("Created directory: '" + directory.string() + "'.");
        }
    }

    void FileSystemTool::ensureDirectoryForFile(const fs::path& filePath)
    {
        ensureDirectory(filePath.parent_path());
    }

    bool FileSystemTool::hasExtension(const fs::path& path, std::string extension)
    {
        if (!extension.empty() && extension[0] != '.') extension = "." + extension;
        return to_lower(path.extension().string()) == to_lower(extension);
    }

    fs::path FileSystemTool::rebase(const fs::path& source, const fs::path& inputRoot,
                                    const fs::path& outputRoot, const std::string& extension)
    {
        fs::path relative = source.lexically_relative(inputRoot);
        if (relative.empty() || *relative.begin() == "..")
        {
            throw WebpifyException("'" + source.string() + "' is not inside '" + inputRoot.string() + "'");
        }
        fs::path destination = outputRoot / relative;
        destination.replace_extension(extension);
        return destination;
    }

    ByteBuffer FileSystemTool::readFile(const fs::path& path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file) throw WebpifyException("Cannot open '" + path.string() + "' for reading");

        ByteBuffer data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) throw WebpifyException("Failed to read '" + path.string() + "'");
        return data;
    }

    fs::path FileSystemTool::temporarySibling(const fs::path& path)
    {
        std::size_t owner = std::hash<std::thread::id>{}(std::this_thread::get_id());
        return path.parent_path() / ("." + path.filename().string() + ".tmp-" + std::to_string(owner));
    }

    void FileSystemTool::writeFile(const fs::path& path, const ByteBuffer& data)
    {
        fs::path staging = temporarySibling(path);
        {
            std::ofstream file(staging, std::ios::binary | std::ios::trunc);
            if (!file) throw WebpifyException("Cannot open '" + staging.string() + "' for writing");

            file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            file.close();
            if (!file) {
                std::error_code cleanupEc;
                fs::remove(staging, cleanupEc);
                throw WebpifyException("Failed to write '" + path.string() + "'");
            }
        }

        std::error_code ec;
        fs::rename(staging, path, ec);
        if (ec) {
            std::error_code cleanupEc;
            fs::remove(staging, cleanupEc);
            throw WebpifyException("Could not move '" + staging.string() + "' to '" + path.string() + "': " + ec.message());
        }
    }

    // === FileDeleter Implementation ===

    bool FileDeleter::deleteFile(const fs::path& path, std::string& reason)
    {
        std::error_code ec;
        if (fs::remove(path, ec)) return true;

        reason = ec ? ec.message() : "file no longer exists";
        return false;
    }

} // namespace Webpify
