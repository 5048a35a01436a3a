#include "audio/segment_collector.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <string>
#include <utility>

namespace VoiceActivity {

SegmentCollector::SegmentCollector(int sampleRate, int maxSegmentMs)
    : sampleRate_(sampleRate), maxSamples_(0) {
    if (sampleRate_ <= 0) {
        throw DictationEngine::ConfigError(DictationEngine::ErrorCode::AUDIO_INVALID_INPUT_RATE,
                                           "segment sample rate must be positive, got " +
                                               std::to_string(sampleRate));
    }
    if (maxSegmentMs > 0) {
        maxSamples_ = static_cast<size_t>(static_cast<int64_t>(sampleRate_) * maxSegmentMs / 1000);
    }
}

void SegmentCollector::begin(std::chrono::steady_clock::time_point now) {
    if (collecting_) {
        return;
    }
    collecting_ = true;
    current_ = Segment{};
    current_.sampleRate = sampleRate_;
    current_.startTime = now;
}

std::optional<Segment> SegmentCollector::append(const float* samples, size_t count,
                                                std::chrono::steady_clock::time_point now) {
    if (!collecting_ || !samples || count == 0) {
        return std::nullopt;
    }

    if (maxSamples_ == 0) {
        current_.samples.insert(current_.samples.end(), samples, samples + count);
        return std::nullopt;
    }

    const size_t room = maxSamples_ - current_.samples.size();
    const size_t take = std::min(room, count);
    current_.samples.insert(current_.samples.end(), samples, samples + take);
    if (current_.samples.size() < maxSamples_) {
        return std::nullopt;
    }

    LOG_INFO("Segment #{} reached maximum length ({} samples), splitting", nextSequence_,
             maxSamples_);
    Segment full = takeCurrent(now, true);

    // Speech continues in a fresh segment with whatever did not fit
    collecting_ = true;
    current_ = Segment{};
    current_.sampleRate = sampleRate_;
    current_.startTime = now;
    current_.samples.insert(current_.samples.end(), samples + take, samples + count);
    return full;
}

std::optional<Segment> SegmentCollector::end(std::chrono::steady_clock::time_point now) {
    if (!collecting_) {
        return std::nullopt;
    }
    if (current_.samples.empty()) {
        collecting_ = false;
        return std::nullopt;
    }
    return takeCurrent(now, false);
}

void SegmentCollector::abandon() {
    collecting_ = false;
    current_ = Segment{};
}

Segment SegmentCollector::takeCurrent(std::chrono::steady_clock::time_point now,
                                      bool truncated) {
    Segment out = std::move(current_);
    out.endTime = now;
    out.truncated = truncated;
    out.sequence = nextSequence_++;
    current_ = Segment{};
    collecting_ = false;
    return out;
}

}  // namespace VoiceActivity
