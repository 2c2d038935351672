#include "OpenCvCodec.h"

#include <opencv2/opencv.hpp>

#include <algorithm>

namespace Webpify
{
    cv::Mat OpenCvCodec::removeAlphaChannel(const cv::Mat& src)
    {
        if (src.channels() != 4) return src;

        // Create white background
        cv::Mat bg(src.size(), CV_8UC3, cv::Scalar(255, 255, 255));

        std::vector<cv::Mat> channels;
        cv::split(src, channels);

        cv::Mat alpha = channels[3];
        cv::Mat rgb;
        cv::merge(std::vector<cv::Mat>{channels[0], channels[1], channels[2]}, rgb);

        // Blend: dst = src * alpha + bg * (1 - alpha)
        alpha.convertTo(alpha, CV_32F, 1.0 / 255.0);
        rgb.convertTo(rgb, CV_32F);
        bg.convertTo(bg, CV_32F);

        cv::Mat dst = cv::Mat::zeros(src.size(), CV_32FC3);

        for (int i = 0; i < 3; ++i) {
            cv::Mat src_c, bg_c;
            cv::extractChannel(rgb, src_c, i);
            cv::extractChannel(bg, bg_c, i);

            cv::Mat res = src_c.mul(alpha) + bg_c.mul(1.0 - alpha);
            cv::insertChannel(res, dst, i);
        }

        dst.convertTo(dst, CV_8UC3);
        return dst;
    }

    cv::Mat OpenCvCodec::toEightBit(const cv::Mat& src)
    {
        if (src.depth() == CV_8U) return src;

        cv::Mat dst;
        if (src.depth() == CV_16U) {
            src.convertTo(dst, CV_MAKETYPE(CV_8U, src.channels()), 1.0 / 257.0);
        } else if (src.depth() == CV_32F || src.depth() == CV_64F) {
            src.convertTo(dst, CV_MAKETYPE(CV_8U, src.channels()), 255.0);
        } else {
            src.convertTo(dst, CV_MAKETYPE(CV_8U, src.channels()));
        }
        return dst;
    }

    std::optional<FormatTag> OpenCvCodec::probe(const ByteBuffer& bytes) const
    {
        return ImageFormat::sniff(bytes);
    }

    std::optional<ImageDescriptor> OpenCvCodec::decode(const ByteBuffer& bytes) const
    {
        auto format = probe(bytes);
        if (!format) return std::nullopt;

        try {
            cv::Mat pixels = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
            if (pixels.empty()) return std::nullopt;
            return ImageDescriptor{*format, pixels};
        } catch (const cv::Exception&) {
            // Truncated or corrupt payload behind a valid signature
            return std::nullopt;
        }
    }

    ByteBuffer OpenCvCodec::encode(const ImageDescriptor& image, const FormatTag& target, int quality) const
    {
        std::string extension = ImageFormat::canonicalExtension(target);
        cv::Mat pixels = toEightBit(image.pixels);
        std::vector<int> params;

        if (target == "image/webp") {
            // libwebp treats quality > 100 as lossless; keep the request lossy
            params = {cv::IMWRITE_WEBP_QUALITY, std::max(1, std::min(quality, 100))};
        } else if (target == "image/jpeg") {
            pixels = removeAlphaChannel(pixels);
            params = {cv::IMWRITE_JPEG_QUALITY, std::max(0, std::min(quality, 100))};
        }

        ByteBuffer encoded;
        try {
            if (!cv::imencode(extension, pixels, encoded, params)) {
                throw WebpifyException("OpenCV could not encode " + target);
            }
        } catch (const cv::Exception& e) {
            throw WebpifyException("OpenCV failed to encode " + target + ": " + e.what());
        }
        return encoded;
    }

} // namespace Webpify
