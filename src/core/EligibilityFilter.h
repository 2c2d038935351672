#pragma once
#include "ConversionTask.h"

#include <optional>

namespace Webpify
{
    /**
     * @brief Decides from the content-derived format whether a file is converted.
     *
     * Rules, first match wins:
     *  1. format is the target format      -> AlreadyTargetFormat
     *  2. format could not be determined   -> UnknownFormat
     *  3. format is in the skip set        -> ExplicitlySkippedFormat
     *  4. format is not in the allow set   -> UnsupportedFormat
     *  5. otherwise eligible
     */
    class EligibilityFilter
    {
    public:
        /**
         * @return std::nullopt if the file is eligible, the skip reason otherwise.
         */
        static std::optional<SkipReason> classify(const std::optional<FormatTag>& format,
                                                  const ConversionTask& task);
    };

} // namespace Webpify
