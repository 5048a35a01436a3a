#include "audio/alsa_capture.h"

#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

using AudioCapture::AlsaCapture;

TEST(AlsaCaptureHelpers, MapsFormatsToAlsaEnums) {
    EXPECT_EQ(AlsaCapture::toAlsaFormat(AlsaCapture::SampleFormat::S16_LE), SND_PCM_FORMAT_S16_LE);
    EXPECT_EQ(AlsaCapture::toAlsaFormat(AlsaCapture::SampleFormat::S24_3LE),
              SND_PCM_FORMAT_S24_3LE);
    EXPECT_EQ(AlsaCapture::fromAlsaFormat(SND_PCM_FORMAT_S32_LE),
              AlsaCapture::SampleFormat::S32_LE);
    EXPECT_FALSE(AlsaCapture::fromAlsaFormat(SND_PCM_FORMAT_FLOAT_LE).has_value());
}

TEST(AlsaCaptureHelpers, ParsesFormatNames) {
    EXPECT_EQ(AlsaCapture::parseFormat("S16_LE"), AlsaCapture::SampleFormat::S16_LE);
    EXPECT_EQ(AlsaCapture::parseFormat("s24_3le"), AlsaCapture::SampleFormat::S24_3LE);
    EXPECT_FALSE(AlsaCapture::parseFormat("S24_LE").has_value());
    EXPECT_FALSE(AlsaCapture::parseFormat("").has_value());
}

TEST(AlsaCaptureHelpers, SelectSupportedFormatPrefersRequested) {
    const auto supported = [](AlsaCapture::SampleFormat fmt) {
        return fmt == AlsaCapture::SampleFormat::S24_3LE ||
               fmt == AlsaCapture::SampleFormat::S16_LE;
    };
    auto selected =
        AlsaCapture::selectSupportedFormat(AlsaCapture::SampleFormat::S24_3LE, supported);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected.value(), AlsaCapture::SampleFormat::S24_3LE);
}

TEST(AlsaCaptureHelpers, SelectSupportedFormatFallsBackToSixteenBit) {
    const auto supported = [](AlsaCapture::SampleFormat fmt) {
        return fmt != AlsaCapture::SampleFormat::S24_3LE;
    };
    auto selected =
        AlsaCapture::selectSupportedFormat(AlsaCapture::SampleFormat::S24_3LE, supported);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected.value(), AlsaCapture::SampleFormat::S16_LE);
}

TEST(AlsaCaptureHelpers, SelectSupportedFormatReturnsNulloptWhenNone) {
    const auto supported = [](AlsaCapture::SampleFormat /*fmt*/) { return false; };
    EXPECT_FALSE(AlsaCapture::selectSupportedFormat(AlsaCapture::SampleFormat::S16_LE, supported)
                     .has_value());
}

TEST(AlsaCaptureHelpers, CalculatesBytesPerFrame) {
    AlsaCapture::Config config{};
    config.channels = 2;

    config.format = AlsaCapture::SampleFormat::S16_LE;
    EXPECT_EQ(AlsaCapture::bytesPerFrame(config), 4U);

    config.format = AlsaCapture::SampleFormat::S24_3LE;
    EXPECT_EQ(AlsaCapture::bytesPerFrame(config), 6U);

    config.channels = 1;
    config.format = AlsaCapture::SampleFormat::S32_LE;
    EXPECT_EQ(AlsaCapture::bytesPerFrame(config), 4U);
}

TEST(AlsaCaptureHelpers, ConvertsSixteenBitToFloat) {
    AlsaCapture::Config config{};
    config.channels = 2;
    config.format = AlsaCapture::SampleFormat::S16_LE;

    // 16384, -16384 little-endian
    const std::vector<std::uint8_t> raw = {0x00, 0x40, 0x00, 0xC0};
    std::vector<float> out;
    AlsaCapture::convertToFloat(raw.data(), 1, config, out);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_FLOAT_EQ(out[0], 0.5f);
    EXPECT_FLOAT_EQ(out[1], -0.5f);
}

TEST(AlsaCaptureHelpers, ConvertsPackedTwentyFourBitToFloat) {
    AlsaCapture::Config config{};
    config.channels = 1;
    config.format = AlsaCapture::SampleFormat::S24_3LE;

    const std::vector<std::uint8_t> raw = {0x00, 0x00, 0x40, 0x00, 0x00, 0xC0};
    std::vector<float> out;
    AlsaCapture::convertToFloat(raw.data(), 2, config, out);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_FLOAT_EQ(out[0], 0.5f);
    EXPECT_FLOAT_EQ(out[1], -0.5f);
}

TEST(AlsaCaptureHelpers, ClosedCaptureReportsNothing) {
    AlsaCapture capture;
    EXPECT_FALSE(capture.isOpen());
    EXPECT_FALSE(capture.currentSampleRate().has_value());
    std::vector<float> out;
    EXPECT_LT(capture.readFloat(out), 0);
}
