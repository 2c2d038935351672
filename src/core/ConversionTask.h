#pragma once
#include "ImageFormat.h"

#include <set>
#include <variant>

namespace Webpify
{
    /**
     * @brief One discovered file plus the settings it is converted with.
     * Created once per file by the catalog stage and never modified.
     */
    struct ConversionTask
    {
        fs::path sourcePath;
        fs::path inputRoot;
        fs::path outputRoot;
        int quality{80};
        std::set<FormatTag> allowedFormats;
        std::set<FormatTag> skipFormats;
        bool deleteOriginal{false};
        FormatTag targetFormat{"image/webp"};
    };

    enum class SkipReason
    {
        AlreadyTargetFormat,
        UnknownFormat,
        ExplicitlySkippedFormat,
        UnsupportedFormat
    };

    const char* toString(SkipReason reason);

    struct Converted
    {
        fs::path source;
        fs::path destination;
        std::string note; ///< Result of deleting the original, empty if not requested
    };

    struct Skipped
    {
        fs::path source;
        SkipReason reason;
        FormatTag format; ///< Detected format, empty when unknown
    };

    struct Error
    {
        fs::path source;
        std::string message;
    };

    /// Exactly one per ConversionTask.
    using TaskOutcome = std::variant<Converted, Skipped, Error>;

    const fs::path& outcomeSource(const TaskOutcome& outcome);

} // namespace Webpify
