#pragma once
#include "ConversionTask.h"

#include <functional>

namespace Webpify
{
    /**
     * @brief Runs a job once per task on a fixed-width pool of threads.
     *
     * run() is a barrier: it returns after every task has produced its outcome.
     * Outcomes come back in task order. A job that throws produces an Error
     * outcome for its own task and leaves the rest of the batch untouched.
     * Width 1 runs everything on the calling thread.
     */
    class BatchScheduler
    {
    public:
        using Job = std::function<TaskOutcome(const ConversionTask&)>;

        /**
         * @param width Maximum number of concurrently running tasks, 0 for the host's concurrency.
         */
        explicit BatchScheduler(unsigned int width = 0);

        unsigned int width() const { return m_width; }

        std::vector<TaskOutcome> run(const std::vector<ConversionTask>& tasks, const Job& job) const;

        /// std::thread::hardware_concurrency(), at least 1.
        static unsigned int defaultWidth();

    private:
        static TaskOutcome runGuarded(const Job& job, const ConversionTask& task);

        unsigned int m_width;
    };

} // namespace Webpify
