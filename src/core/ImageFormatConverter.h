#pragma once
#include "BatchReport.h"
#include "ConversionConfig.h"
#include "ImageCodec.h"

#include <iostream>
#include <map>

namespace Webpify
{
    struct BatchResult
    {
        BatchReport report;
        std::vector<TaskOutcome> outcomes;
    };

    /**
     * @brief Batch conversion of a directory tree to the target format.
     */
    class ImageFormatConverter
    {
    public:
        /**
         * @brief Scans the input tree, converts every eligible image on a worker
         * pool and prints the summary to @p out.
         *
         * Per-file failures end up in the report; only configuration problems
         * and a missing input root abort the run.
         *
         * @throws ConfigError if @p config is invalid.
         * @throws InputNotFoundError if the input root does not exist. No task runs.
         */
        static BatchResult convertBatch(const ConversionConfig& config,
                                        const ImageCodec& codec,
                                        std::ostream& out = std::cout);

        /**
         * @brief One task per cataloged file, all sharing the settings of @p config.
         */
        static std::vector<ConversionTask> buildTasks(const ConversionConfig& config,
                                                      const std::vector<fs::path>& files);

        /**
         * @brief Finds tasks that would write the same destination as an earlier task.
         *
         * The first task in catalog order keeps the destination. Every later one is
         * returned, keyed by its source path, with the message of the Error it is
         * reported as. Those tasks are never converted and their sources never deleted.
         */
        static std::map<fs::path, std::string> findDestinationConflicts(const std::vector<ConversionTask>& tasks);
    };

} // namespace Webpify
