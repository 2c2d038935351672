#pragma once

#include "core/ImageCodec.h"
#include <atomic>
#include <functional>
#include <string>

/**
 * @brief Test double for ImageCodec working on a tiny text format.
 *
 * Input files look like "FAKE <format tag>\n<payload>". Payloads with special
 * meaning:
 *   CORRUPT      header is recognized but decode() fails
 *   FAIL_ENCODE  encode() throws WebpifyException
 *   THROW_INT    encode() throws a non-std exception
 *
 * encode() produces "ENC <target> q=<quality>\n<payload>", which is again
 * readable by probe() as format <target>.
 */
class FakeCodec : public Webpify::ImageCodec {
public:
    std::function<void()> onEncode;
    mutable std::atomic<int> decodeCalls{0};
    mutable std::atomic<int> encodeCalls{0};

    static std::string makeFile(const std::string& format, const std::string& payload = "pixels") {
        return "FAKE " + format + "\n" + payload;
    }

    std::optional<Webpify::FormatTag> probe(const Webpify::ByteBuffer& bytes) const override {
        std::string text(bytes.begin(), bytes.end());
        std::string prefix;
        if (text.rfind("FAKE ", 0) == 0) prefix = "FAKE ";
        else if (text.rfind("ENC ", 0) == 0) prefix = "ENC ";
        else return std::nullopt;

        auto end = text.find_first_of(" \n", prefix.size());
        if (end == std::string::npos) return std::nullopt;
        return text.substr(prefix.size(), end - prefix.size());
    }

    std::optional<Webpify::ImageDescriptor> decode(const Webpify::ByteBuffer& bytes) const override {
        decodeCalls++;
        auto format = probe(bytes);
        if (!format) return std::nullopt;

        std::string payload = payloadOf(bytes);
        if (payload == "CORRUPT") return std::nullopt;

        cv::Mat pixels(1, static_cast<int>(payload.size()), CV_8UC1);
        std::copy(payload.begin(), payload.end(), pixels.data);
        return Webpify::ImageDescriptor{*format, pixels};
    }

    Webpify::ByteBuffer encode(const Webpify::ImageDescriptor& image, const Webpify::FormatTag& target,
                               int quality) const override {
        encodeCalls++;
        if (onEncode) onEncode();

        std::string payload(image.pixels.data, image.pixels.data + image.pixels.total());
        if (payload == "FAIL_ENCODE") throw Webpify::WebpifyException("encoder exploded");
        if (payload == "THROW_INT") throw 42;

        std::string out = "ENC " + target + " q=" + std::to_string(quality) + "\n" + payload;
        return Webpify::ByteBuffer(out.begin(), out.end());
    }

private:
    static std::string payloadOf(const Webpify::ByteBuffer& bytes) {
        std::string text(bytes.begin(), bytes.end());
        auto newline = text.find('\n');
        return newline == std::string::npos ? std::string() : text.substr(newline + 1);
    }
};
