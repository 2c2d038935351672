#pragma once
#include "Common.h"

#include <optional>

namespace Webpify
{
    /// Content-derived format identifier, a MIME string such as "image/png".
    using FormatTag = std::string;

    /// Raw encoded file contents.
    using ByteBuffer = std::vector<unsigned char>;

    /**
     * @brief One row of the format table.
     */
    struct FormatInfo
    {
        FormatTag tag;                    ///< MIME string
        std::string extension;            ///< Canonical extension with leading dot
        std::vector<std::string> aliases; ///< Short names accepted on the command line
    };

    /**
     * @brief The format table: tag <-> extension mapping and content sniffing.
     */
    class ImageFormat
    {
    public:
        /**
         * @brief Identifies the format from the leading bytes of a file.
         * @return The format tag, or std::nullopt if no known signature matches.
         */
        static std::optional<FormatTag> sniff(const ByteBuffer& bytes);

        /**
         * @brief Maps a user-supplied name ("jpg", "JPEG", "image/jpeg") to its tag.
         */
        static std::optional<FormatTag> normalize(const std::string& name);

        /**
         * @brief Canonical extension (".webp") for a known tag.
         * @throws WebpifyException if the tag is not in the table.
         */
        static std::string canonicalExtension(const FormatTag& tag);

        static bool isKnown(const FormatTag& tag);

        static const std::vector<FormatInfo>& table();
    };

} // namespace Webpify
