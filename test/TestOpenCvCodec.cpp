#include "BaseTestFixture.h"
#include "core/FileSystemTool.h"
#include "core/ImageFormatConverter.h"
#include "core/OpenCvCodec.h"

#include <sstream>

class OpenCvCodecTest : public BaseTestFixture {
protected:
    OpenCvCodec codec;

    ImageDescriptor decodeFile(const fs::path& path) {
        auto decoded = codec.decode(FileSystemTool::readFile(path));
        EXPECT_TRUE(decoded.has_value()) << "Could not decode " << path;
        return decoded.value_or(ImageDescriptor{});
    }
};

TEST_F(OpenCvCodecTest, DecodesPngWithDetectedFormat) {
    writeImage(inputDir / "red.png", ".png", 8, 6, cv::Scalar(0, 0, 255));

    ImageDescriptor image = decodeFile(inputDir / "red.png");

    EXPECT_EQ(image.format, "image/png");
    EXPECT_EQ(image.pixels.cols, 8);
    EXPECT_EQ(image.pixels.rows, 6);
    EXPECT_EQ(image.pixels.channels(), 3);
}

TEST_F(OpenCvCodecTest, FormatComesFromContentNotExtension) {
    // PNG bytes behind a .jpg name
    writeImage(inputDir / "liar.jpg", ".png", 4, 4, cv::Scalar(10, 20, 30));

    auto bytes = FileSystemTool::readFile(inputDir / "liar.jpg");
    EXPECT_EQ(codec.probe(bytes), "image/png");
}

TEST_F(OpenCvCodecTest, TruncatedJpegIsNotDecoded) {
    writeBytes(inputDir / "broken.jpg", std::string("\xFF\xD8\xFF\xE0", 4) + "not really a jpeg body");

    auto bytes = FileSystemTool::readFile(inputDir / "broken.jpg");
    EXPECT_EQ(codec.probe(bytes), "image/jpeg");
    EXPECT_FALSE(codec.decode(bytes).has_value());
}

TEST_F(OpenCvCodecTest, TextIsNotAnImage) {
    writeBytes(inputDir / "notes.png", "just some text");

    auto bytes = FileSystemTool::readFile(inputDir / "notes.png");
    EXPECT_FALSE(codec.probe(bytes).has_value());
    EXPECT_FALSE(codec.decode(bytes).has_value());
}

TEST_F(OpenCvCodecTest, EncodesWebp) {
    writeImage(inputDir / "green.png", ".png", 16, 12, cv::Scalar(0, 255, 0));
    ImageDescriptor image = decodeFile(inputDir / "green.png");

    ByteBuffer encoded = codec.encode(image, "image/webp", 80);

    EXPECT_EQ(ImageFormat::sniff(encoded), "image/webp");
    auto roundTrip = codec.decode(encoded);
    ASSERT_TRUE(roundTrip.has_value());
    EXPECT_EQ(roundTrip->pixels.cols, 16);
    EXPECT_EQ(roundTrip->pixels.rows, 12);
}

TEST_F(OpenCvCodecTest, LowerQualityGivesSmallerWebp) {
    cv::Mat noise(64, 64, CV_8UC3);
    cv::randu(noise, cv::Scalar::all(0), cv::Scalar::all(255));
    ImageDescriptor image{"image/png", noise};

    ByteBuffer low = codec.encode(image, "image/webp", 10);
    ByteBuffer high = codec.encode(image, "image/webp", 95);

    EXPECT_LT(low.size(), high.size());
}

TEST_F(OpenCvCodecTest, JpegTargetFlattensAlpha) {
    writeImage(inputDir / "rgba.png", ".png", 10, 10, cv::Scalar(255, 0, 0, 128), 4);
    ImageDescriptor image = decodeFile(inputDir / "rgba.png");
    ASSERT_EQ(image.pixels.channels(), 4);

    ByteBuffer encoded = codec.encode(image, "image/jpeg", 90);

    EXPECT_EQ(ImageFormat::sniff(encoded), "image/jpeg");
    auto roundTrip = codec.decode(encoded);
    ASSERT_TRUE(roundTrip.has_value());
    EXPECT_EQ(roundTrip->pixels.channels(), 3);
}

TEST_F(OpenCvCodecTest, SixteenBitInputIsEncoded) {
    cv::Mat deep(8, 8, CV_16UC3, cv::Scalar(65535, 0, 30000));
    ImageDescriptor image{"image/png", deep};

    ByteBuffer encoded = codec.encode(image, "image/webp", 80);
    EXPECT_EQ(ImageFormat::sniff(encoded), "image/webp");
}

TEST_F(OpenCvCodecTest, ConvertsRealTree) {
    writeImage(inputDir / "a.png", ".png", 20, 10, cv::Scalar(1, 2, 3));
    writeImage(inputDir / "nested" / "b.jpg", ".jpg", 12, 12, cv::Scalar(200, 100, 50));
    writeBytes(inputDir / "broken.jpg", std::string("\xFF\xD8\xFF\xE0", 4) + "garbage");
    writeBytes(inputDir / "readme.txt", "hello");

    ConversionConfig config;
    config.inputPath = inputDir.string();
    config.outputPath = outputDir.string();
    config.jobs = 2;

    std::ostringstream summary;
    auto result = ImageFormatConverter::convertBatch(config, codec, summary);

    EXPECT_EQ(result.report.total, 4u);
    EXPECT_EQ(result.report.converted, 2u);
    EXPECT_EQ(result.report.skipped, 2u);
    EXPECT_EQ(result.report.errors, 0u);

    ASSERT_TRUE(fs::exists(outputDir / "a.webp"));
    ASSERT_TRUE(fs::exists(outputDir / "nested" / "b.webp"));
    EXPECT_EQ(codec.probe(FileSystemTool::readFile(outputDir / "a.webp")), "image/webp");

    ImageDescriptor converted = decodeFile(outputDir / "nested" / "b.webp");
    EXPECT_EQ(converted.pixels.cols, 12);
    EXPECT_EQ(converted.pixels.rows, 12);
}
