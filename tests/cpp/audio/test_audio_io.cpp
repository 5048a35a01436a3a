#include "audio/audio_io.h"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

class AudioIOTest : public ::testing::Test {
   protected:
    void SetUp() override {
        tempDir = fs::temp_directory_path() /
                  ("dictation_test_" + std::to_string(::getpid()) + "_" +
                   ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    fs::path tempDir;
};

TEST_F(AudioIOTest, MonoWavReadsBackInBlocks) {
    std::vector<float> samples(1000);
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = (i % 2 == 0) ? 0.5f : -0.5f;
    }
    const std::string path = (tempDir / "segment.wav").string();
    ASSERT_TRUE(AudioIO::writeMonoWav(path, samples, 16000));

    AudioIO::WavReader reader;
    ASSERT_TRUE(reader.open(path));
    EXPECT_EQ(reader.getSampleRate(), 16000);
    EXPECT_EQ(reader.getChannels(), 1);
    EXPECT_EQ(reader.getFrames(), 1000);

    std::vector<float> block(300);
    std::vector<float> readBack;
    sf_count_t frames = 0;
    while ((frames = reader.readBlock(block.data(), 300)) > 0) {
        readBack.insert(readBack.end(), block.begin(), block.begin() + frames);
    }
    ASSERT_EQ(readBack.size(), samples.size());
    // 16-bit quantization
    EXPECT_NEAR(readBack[0], 0.5f, 1e-4f);
    EXPECT_NEAR(readBack[1], -0.5f, 1e-4f);
}

TEST_F(AudioIOTest, FloatWriterKeepsBlocksInOrder) {
    const std::string path = (tempDir / "stereo.wav").string();
    {
        AudioIO::WavWriter writer;
        ASSERT_TRUE(writer.open(path, 48000, 2, AudioIO::WavWriter::SampleFormat::Float32));
        const std::vector<float> first = {0.1f, 0.2f, 0.3f, 0.4f};
        const std::vector<float> second = {0.5f, 0.6f};
        EXPECT_TRUE(writer.writeBlock(first.data(), 2));
        EXPECT_TRUE(writer.writeBlock(second.data(), 1));
    }

    AudioIO::WavReader reader;
    ASSERT_TRUE(reader.open(path));
    EXPECT_EQ(reader.getChannels(), 2);
    std::vector<float> buffer(8, 0.0f);
    ASSERT_EQ(reader.readBlock(buffer.data(), 4), 3);
    EXPECT_FLOAT_EQ(buffer[4], 0.5f);
    EXPECT_FLOAT_EQ(buffer[5], 0.6f);
}

TEST_F(AudioIOTest, ClosedFilesFailCleanly) {
    AudioIO::WavReader reader;
    EXPECT_FALSE(reader.open((tempDir / "missing.wav").string()));
    EXPECT_FALSE(reader.isOpen());
    float sample = 0.0f;
    EXPECT_EQ(reader.readBlock(&sample, 1), -1);

    AudioIO::WavWriter writer;
    EXPECT_FALSE(writer.writeBlock(&sample, 1));
}
