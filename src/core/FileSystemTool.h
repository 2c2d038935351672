#pragma once
#include "ImageFormat.h"

namespace Webpify
{
    /**
     * @brief File system helpers shared by the catalog and the workers:
     * path normalization, directory creation and whole-file I/O.
     */
    class FileSystemTool
    {
    public:
        /**
         * @brief Converts a relative path to an absolute, lexically normal path.
         */
        static fs::path toAbsolutePath(const fs::path& path);

        /**
         * @brief Creates a directory and its parents.
         *
         * Safe to call concurrently for overlapping paths: a directory that
         * already exists, or that another thread created first, counts as success.
         * @throws WebpifyException if the directory cannot be created.
         */
        static void ensureDirectory(const fs::path& directory);

        /**
         * @brief Ensures the parent directory of a given file path exists.
         */
        static void ensureDirectoryForFile(const fs::path& filePath);

        /**
         * @brief Case-insensitive extension match. @p extension may omit the dot.
         */
        static bool hasExtension(const fs::path& path, std::string extension);

        /**
         * @brief Re-roots @p source from @p inputRoot under @p outputRoot with a new extension.
         */
        static fs::path rebase(const fs::path& source, const fs::path& inputRoot,
                               const fs::path& outputRoot, const std::string& extension);

        /**
         * @throws WebpifyException if the file cannot be opened or read.
         */
        static ByteBuffer readFile(const fs::path& path);

        /**
         * @brief Writes @p data to a hidden sibling of @p path and renames it into place,
         * so readers see either the old file or the complete new one.
         * @throws WebpifyException if the file cannot be opened or fully written.
         */
        static void writeFile(const fs::path& path, const ByteBuffer& data);

    private:
        /// ".<name>.tmp-<thread>" next to @p path.
        static fs::path temporarySibling(const fs::path& path);
    };

    class FileDeleter
    {
    public:
        /**
         * @brief Removes a single file.
         * @param reason Set to the failure reason when the file was not removed.
         * @return true if the file was removed.
         */
        static bool deleteFile(const fs::path& path, std::string& reason);
    };

} // namespace Webpify
