#pragma once
#include "ConversionTask.h"
#include "ImageCodec.h"

namespace Webpify
{
    /**
     * @brief Converts a single file: read, classify, decode, encode, write and
     * optionally delete the original.
     *
     * process() never throws. Every failure is returned as an Error outcome so
     * one bad file cannot take down the other workers. The worker holds no
     * mutable state and may be shared by all threads of a batch.
     */
    class ConversionWorker
    {
    public:
        explicit ConversionWorker(const ImageCodec& codec);

        TaskOutcome process(const ConversionTask& task) const;

        TaskOutcome operator()(const ConversionTask& task) const { return process(task); }

        /**
         * @brief Destination for @p task: source re-rooted under the output root
         * with the target format's extension.
         */
        static fs::path destinationFor(const ConversionTask& task);

    private:
        TaskOutcome convert(const ConversionTask& task) const;

        const ImageCodec& m_codec;
    };

} // namespace Webpify
