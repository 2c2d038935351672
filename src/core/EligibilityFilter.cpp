#include "EligibilityFilter.h"

namespace Webpify
{
    std::optional<SkipReason> EligibilityFilter::classify(const std::optional<FormatTag>& format,
                                                          const ConversionTask& task)
    {
        if (format && *format == task.targetFormat) return SkipReason::AlreadyTargetFormat;
        if (!format || format->empty()) return SkipReason::UnknownFormat;
        if (task.skipFormats.count(*format)) return SkipReason::ExplicitlySkippedFormat;
        if (!task.allowedFormats.count(*format)) return SkipReason::UnsupportedFormat;
        return std::nullopt;
    }

} // namespace Webpify
