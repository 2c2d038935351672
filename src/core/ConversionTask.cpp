#include "ConversionTask.h"

namespace Webpify
{
    const char* toString(SkipReason reason)
    {
        switch (reason)
        {
            case SkipReason::AlreadyTargetFormat:     return "already target format";
            case SkipReason::UnknownFormat:           return "unknown format";
            case SkipReason::ExplicitlySkippedFormat: return "skipped format";
            case SkipReason::UnsupportedFormat:       return "unsupported format";
        }
        return "unknown reason";
    }

    const fs::path& outcomeSource(const TaskOutcome& outcome)
    {
        return std::visit([](const auto& value) -> const fs::path& { return value.source; }, outcome);
    }

} // namespace Webpify
