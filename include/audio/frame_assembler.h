#ifndef FRAME_ASSEMBLER_H
#define FRAME_ASSEMBLER_H

#include <cstddef>
#include <functional>
#include <vector>

namespace VoiceActivity {

// Slices a stream of variable-length chunks into fixed-size frames.
// The remainder of each chunk is kept for the next push().
class FrameAssembler {
   public:
    using FrameHandler = std::function<void(const float* frame, size_t frameSize)>;

    // frameSize must be positive; throws DictationEngine::ConfigError otherwise
    explicit FrameAssembler(size_t frameSize);

    // Returns the number of complete frames handed to `handler`
    size_t push(const float* samples, size_t count, const FrameHandler& handler);
    size_t push(const std::vector<float>& chunk, const FrameHandler& handler);

    // Zero-pad and emit any buffered remainder. Returns true if a frame was emitted.
    bool flush(const FrameHandler& handler);

    void clear() {
        pending_.clear();
    }

    size_t frameSize() const {
        return frameSize_;
    }
    size_t pendingSamples() const {
        return pending_.size();
    }

   private:
    size_t frameSize_;
    std::vector<float> pending_;
};

}  // namespace VoiceActivity

#endif  // FRAME_ASSEMBLER_H
