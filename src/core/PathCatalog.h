#pragma once
#include "Common.h"

namespace Webpify
{
    /**
     * @brief Recursively enumerates the candidate files under an input root.
     */
    class PathCatalog
    {
    public:
        /**
         * @brief Lists every regular file below @p inputRoot, sorted by path.
         *
         * Files whose extension case-insensitively equals @p excludedExtension
         * are left out; they would be skipped after decoding anyway.
         * Directory symlinks are not followed. A subdirectory that cannot be
         * listed is reported with a warning and skipped; the rest of the tree is
         * still scanned.
         *
         * @throws InputNotFoundError if @p inputRoot does not exist or is not a directory.
         */
        static std::vector<fs::path> scan(const fs::path& inputRoot, const std::string& excludedExtension);
    };

} // namespace Webpify
