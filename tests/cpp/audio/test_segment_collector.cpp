#include "audio/segment_collector.h"
#include "core/error_codes.h"

#include <gtest/gtest.h>
#include <vector>

using VoiceActivity::Segment;
using VoiceActivity::SegmentCollector;
using TimePoint = std::chrono::steady_clock::time_point;

namespace {

const TimePoint kStart{};

TimePoint at(int ms) {
    return kStart + std::chrono::milliseconds(ms);
}

}  // namespace

TEST(SegmentCollector, CollectsBetweenBeginAndEnd) {
    SegmentCollector collector(16000, 0);
    std::vector<float> frame(480, 0.5f);

    collector.begin(at(0));
    EXPECT_TRUE(collector.isCollecting());
    collector.append(frame.data(), frame.size(), at(30));
    collector.append(frame.data(), frame.size(), at(60));

    auto segment = collector.end(at(90));
    ASSERT_TRUE(segment.has_value());
    EXPECT_EQ(segment->samples.size(), 960u);
    EXPECT_EQ(segment->sampleRate, 16000);
    EXPECT_EQ(segment->startTime, at(0));
    EXPECT_EQ(segment->endTime, at(90));
    EXPECT_EQ(segment->sequence, 0u);
    EXPECT_FALSE(segment->truncated);
    EXPECT_DOUBLE_EQ(segment->durationSeconds(), 0.06);
    EXPECT_FALSE(collector.isCollecting());
}

TEST(SegmentCollector, AppendIgnoredWhileIdle) {
    SegmentCollector collector(16000, 0);
    std::vector<float> frame(480, 0.5f);
    EXPECT_FALSE(collector.append(frame.data(), frame.size(), at(0)).has_value());
    EXPECT_EQ(collector.collectedSamples(), 0u);
    EXPECT_FALSE(collector.end(at(10)).has_value());
}

TEST(SegmentCollector, EmptySegmentIsNotEmitted) {
    SegmentCollector collector(16000, 0);
    collector.begin(at(0));
    EXPECT_FALSE(collector.end(at(100)).has_value());
    EXPECT_EQ(collector.segmentsEmitted(), 0u);
}

TEST(SegmentCollector, MaximumLengthSplitsSegment) {
    // 100 ms cap = 1600 samples
    SegmentCollector collector(16000, 100);
    std::vector<float> frame(480, 0.5f);
    collector.begin(at(0));

    std::vector<Segment> emitted;
    for (int i = 0; i < 4; ++i) {
        if (auto segment = collector.append(frame.data(), frame.size(), at(30 * (i + 1)))) {
            emitted.push_back(std::move(*segment));
        }
    }

    ASSERT_EQ(emitted.size(), 1u);
    EXPECT_EQ(emitted[0].samples.size(), 1600u);
    EXPECT_TRUE(emitted[0].truncated);
    EXPECT_TRUE(collector.isCollecting());
    // 4 * 480 = 1920, of which 320 spill into the next segment
    EXPECT_EQ(collector.collectedSamples(), 320u);

    auto tail = collector.end(at(150));
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(tail->sequence, 1u);
    EXPECT_EQ(tail->startTime, at(120));
    EXPECT_FALSE(tail->truncated);
}

TEST(SegmentCollector, AbandonDropsAudio) {
    SegmentCollector collector(16000, 0);
    std::vector<float> frame(480, 0.5f);
    collector.begin(at(0));
    collector.append(frame.data(), frame.size(), at(30));
    collector.abandon();
    EXPECT_FALSE(collector.isCollecting());
    EXPECT_FALSE(collector.end(at(60)).has_value());
}

TEST(SegmentCollector, InvalidRateThrows) {
    EXPECT_THROW(SegmentCollector(0, 1000), DictationEngine::ConfigError);
}
