#include "PathCatalog.h"
#include "FileSystemTool.h"
#include "../utils/Logger.h"

#include <system_error>

namespace Webpify
{
    std::vector<fs::path> PathCatalog::scan(const fs::path& inputRoot, const std::string& excludedExtension)
    {
        fs::path root = FileSystemTool::toAbsolutePath(inputRoot);

        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            throw InputNotFoundError(root);
        }

        std::vector<fs::path> files;
        std::vector<fs::path> pending{root};

        while (!pending.empty())
        {
            fs::path directory = pending.back();
            pending.pop_back();

            std::error_code listEc;
            fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, listEc);
            if (listEc) {
                if (directory == root) {
                    throw WebpifyException("Cannot read directory '" + root.string() + "': " + listEc.message());
                }
                Logger::warn("Skipping directory '" + directory.string() + "': " + listEc.message());
                continue;
            }

            const fs::directory_iterator end;
            while (it != end)
            {
                const fs::directory_entry& entry = *it;
                std::error_code typeEc;
                if (entry.is_directory(typeEc)) {
                    // Directory symlinks are not followed
                    if (!entry.is_symlink(typeEc)) pending.push_back(entry.path());
                } else if (entry.is_regular_file(typeEc) && !FileSystemTool::hasExtension(entry.path(), excludedExtension)) {
                    files.push_back(entry.path());
                }

                it.increment(listEc);
                if (listEc) {
                    // Only the rest of this directory is lost, the walk goes on
                    Logger::warn("Stopped listing '" + directory.string() + "' early: " + listEc.message());
                    break;
                }
            }
        }

        std::sort(files.begin(), files.end());
        return files;
    }

} // namespace Webpify
