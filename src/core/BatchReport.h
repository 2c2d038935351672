#pragma once
#include "ConversionTask.h"

#include <optional>
#include <ostream>

namespace Webpify
{
    /**
     * @brief Totals for one batch. Always satisfies total == converted + skipped + errors.
     */
    struct BatchReport
    {
        std::size_t total{0};
        std::size_t converted{0};
        std::size_t skipped{0};
        std::size_t errors{0};
        std::optional<double> elapsedSeconds;

        static BatchReport fromOutcomes(const std::vector<TaskOutcome>& outcomes,
                                        std::optional<double> elapsedSeconds = std::nullopt);

        /// Converted files per second, 0 when no positive elapsed time was recorded.
        [[nodiscard]] double throughput() const;

        /**
         * @brief One human-readable line for an outcome.
         *
         *   "Converted X to Y" (+ " | note")
         *   "Skipped (reason): X"
         *   "Error processing X: message"
         */
        static std::string describe(const TaskOutcome& outcome);

        /**
         * @brief Writes the summary header, one line per outcome, then the totals.
         */
        void print(std::ostream& out, const std::vector<TaskOutcome>& outcomes) const;

        /// Writes only the totals block.
        void printTotals(std::ostream& out) const;
    };

} // namespace Webpify
