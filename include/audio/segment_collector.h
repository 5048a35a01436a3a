#ifndef SEGMENT_COLLECTOR_H
#define SEGMENT_COLLECTOR_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace VoiceActivity {

// Audio spanning one speech_start -> speech_end interval
struct Segment {
    std::vector<float> samples;
    int sampleRate = 0;
    std::chrono::steady_clock::time_point startTime;
    std::chrono::steady_clock::time_point endTime;
    uint64_t sequence = 0;
    bool truncated = false;  // Cut at the maximum length, speech continued

    double durationSeconds() const {
        return sampleRate > 0
                   ? static_cast<double>(samples.size()) / static_cast<double>(sampleRate)
                   : 0.0;
    }
};

// Accumulates frames between segment boundaries.
class SegmentCollector {
   public:
    // maxSegmentMs <= 0 disables the length cap
    SegmentCollector(int sampleRate, int maxSegmentMs);

    void begin(std::chrono::steady_clock::time_point now);

    // Append frame samples to the open segment. When the cap is reached the segment is
    // closed, returned, and a new one is opened at `now`. No-op while not collecting.
    std::optional<Segment> append(const float* samples, size_t count,
                                  std::chrono::steady_clock::time_point now);

    // Close the open segment. Returns nullopt when nothing was collected.
    std::optional<Segment> end(std::chrono::steady_clock::time_point now);

    // Drop the open segment without emitting it
    void abandon();

    bool isCollecting() const {
        return collecting_;
    }
    size_t collectedSamples() const {
        return current_.samples.size();
    }
    uint64_t segmentsEmitted() const {
        return nextSequence_;
    }

   private:
    Segment takeCurrent(std::chrono::steady_clock::time_point now, bool truncated);

    int sampleRate_;
    size_t maxSamples_;
    bool collecting_ = false;
    Segment current_;
    uint64_t nextSequence_ = 0;
};

}  // namespace VoiceActivity

#endif  // SEGMENT_COLLECTOR_H
