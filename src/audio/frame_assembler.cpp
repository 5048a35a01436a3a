#include "audio/frame_assembler.h"

#include "core/error_codes.h"

#include <algorithm>

namespace VoiceActivity {

FrameAssembler::FrameAssembler(size_t frameSize) : frameSize_(frameSize) {
    if (frameSize_ == 0) {
        throw DictationEngine::ConfigError(DictationEngine::ErrorCode::VAD_INVALID_FRAME_DURATION,
                                           "frame size must be positive");
    }
    pending_.reserve(frameSize_);
}

size_t FrameAssembler::push(const std::vector<float>& chunk, const FrameHandler& handler) {
    return push(chunk.data(), chunk.size(), handler);
}

size_t FrameAssembler::push(const float* samples, size_t count, const FrameHandler& handler) {
    if (!samples || count == 0) {
        return 0;
    }

    size_t emitted = 0;
    size_t offset = 0;

    // Complete the partially filled frame first
    if (!pending_.empty()) {
        const size_t need = frameSize_ - pending_.size();
        const size_t take = std::min(need, count);
        pending_.insert(pending_.end(), samples, samples + take);
        offset = take;
        if (pending_.size() < frameSize_) {
            return 0;
        }
        handler(pending_.data(), frameSize_);
        pending_.clear();
        ++emitted;
    }

    // Whole frames straight from the input
    while (count - offset >= frameSize_) {
        handler(samples + offset, frameSize_);
        offset += frameSize_;
        ++emitted;
    }

    pending_.insert(pending_.end(), samples + offset, samples + count);
    return emitted;
}

bool FrameAssembler::flush(const FrameHandler& handler) {
    if (pending_.empty()) {
        return false;
    }
    pending_.resize(frameSize_, 0.0f);
    handler(pending_.data(), frameSize_);
    pending_.clear();
    return true;
}

}  // namespace VoiceActivity
