#include "ImageFormat.h"

#include <cstring>

namespace Webpify
{
    namespace
    {
        bool startsWith(const ByteBuffer& bytes, std::size_t offset, const char* magic, std::size_t length)
        {
            if (bytes.size() < offset + length) return false;
            return std::memcmp(bytes.data() + offset, magic, length) == 0;
        }
    }

    const std::vector<FormatInfo>& ImageFormat::table()
    {
        static const std::vector<FormatInfo> formats = {
            {"image/jpeg", ".jpg",  {"jpeg", "jpg", "jpe"}},
            {"image/png",  ".png",  {"png"}},
            {"image/gif",  ".gif",  {"gif"}},
            {"image/webp", ".webp", {"webp"}},
            {"image/bmp",  ".bmp",  {"bmp"}},
            {"image/tiff", ".tiff", {"tiff", "tif"}},
            {"image/avif", ".avif", {"avif"}},
        };
        return formats;
    }

    std::optional<FormatTag> ImageFormat::sniff(const ByteBuffer& bytes)
    {
        if (startsWith(bytes, 0, "\xFF\xD8\xFF", 3)) return FormatTag("image/jpeg");
        if (startsWith(bytes, 0, "\x89PNG\r\n\x1A\n", 8)) return FormatTag("image/png");
        if (startsWith(bytes, 0, "GIF87a", 6) || startsWith(bytes, 0, "GIF89a", 6)) return FormatTag("image/gif");
        if (startsWith(bytes, 0, "RIFF", 4) && startsWith(bytes, 8, "WEBP", 4)) return FormatTag("image/webp");
        if (startsWith(bytes, 0, "II*\0", 4) || startsWith(bytes, 0, "MM\0*", 4)) return FormatTag("image/tiff");
        if (startsWith(bytes, 4, "ftyp", 4) &&
            (startsWith(bytes, 8, "avif", 4) || startsWith(bytes, 8, "avis", 4))) {
            return FormatTag("image/avif");
        }
        // "BM" alone is too weak; also require the DIB header size to be plausible.
        if (startsWith(bytes, 0, "BM", 2) && bytes.size() >= 18) {
            unsigned int dibSize = bytes[14] | (bytes[15] << 8) | (bytes[16] << 16) | (static_cast<unsigned int>(bytes[17]) << 24);
            if (dibSize == 12 || dibSize == 40 || dibSize == 52 || dibSize == 56 ||
                dibSize == 64 || dibSize == 108 || dibSize == 124) {
                return FormatTag("image/bmp");
            }
        }
        return std::nullopt;
    }

    std::optional<FormatTag> ImageFormat::normalize(const std::string& name)
    {
        std::string key = to_lower(name);
        if (!key.empty() && key[0] == '.') key = key.substr(1);

        for (const auto& info : table())
        {
            if (key == info.tag) return info.tag;
            for (const auto& alias : info.aliases)
            {
                if (key == alias) return info.tag;
            }
        }
        return std::nullopt;
    }

    std::string ImageFormat::canonicalExtension(const FormatTag& tag)
    {
        for (const auto& info : table())
        {
            if (info.tag == tag) return info.extension;
        }
        throw WebpifyException("Unknown image format: " + tag);
    }

    bool ImageFormat::isKnown(const FormatTag& tag)
    {
        for (const auto& info : table())
        {
            if (info.tag == tag) return true;
        }
        return false;
    }

} // namespace Webpify
