#pragma once
#include "ImageCodec.h"

namespace Webpify
{
    /**
     * @brief ImageCodec backed by OpenCV imgcodecs.
     *
     * Format detection uses the signature table in ImageFormat; decoding and
     * encoding go through cv::imdecode / cv::imencode. Which formats actually
     * decode depends on the codecs OpenCV was built with.
     */
    class OpenCvCodec : public ImageCodec
    {
    public:
        std::optional<FormatTag> probe(const ByteBuffer& bytes) const override;
        std::optional<ImageDescriptor> decode(const ByteBuffer& bytes) const override;
        ByteBuffer encode(const ImageDescriptor& image, const FormatTag& target, int quality) const override;

    private:
        // Helper to handle transparency (Alpha -> White Background)
        static cv::Mat removeAlphaChannel(const cv::Mat& src);

        // Encoders only accept 8-bit samples
        static cv::Mat toEightBit(const cv::Mat& src);
    };

} // namespace Webpify
