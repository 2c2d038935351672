#pragma once
#include "ImageFormat.h"

#include <opencv2/core.hpp>

namespace Webpify
{
    /**
     * @brief A decoded image together with the format it was decoded from.
     */
    struct ImageDescriptor
    {
        FormatTag format;
        cv::Mat pixels;
    };

    /**
     * @brief Decode/encode capability used by the conversion pipeline.
     *
     * Implementations must be safe to call concurrently from several worker
     * threads through a const reference.
     */
    class ImageCodec
    {
    public:
        virtual ~ImageCodec() = default;

        /**
         * @brief Header-only format detection.
         * @return The format tag, or std::nullopt if the content is not a known image.
         */
        virtual std::optional<FormatTag> probe(const ByteBuffer& bytes) const = 0;

        /**
         * @brief Full decode.
         * @return The decoded image, or std::nullopt if the content cannot be decoded.
         */
        virtual std::optional<ImageDescriptor> decode(const ByteBuffer& bytes) const = 0;

        /**
         * @brief Encodes an image into the target format.
         * @param quality Encoder quality, 0-100.
         * @throws WebpifyException if the encoder fails.
         */
        virtual ByteBuffer encode(const ImageDescriptor& image, const FormatTag& target, int quality) const = 0;
    };

} // namespace Webpify
