/**
 * @file dictation_pipeline.h
 * @brief Capture-to-text pipeline
 *
 * pushAudio() runs on the capture thread: downmix, resample, frame assembly, VAD and
 * segment collection happen inline and never block. Finished segments go through a
 * bounded queue to one recognizer thread, whose transcripts are submitted to the
 * correction engine in segment order. Corrected results reach the sink on the
 * correction worker thread.
 */

#pragma once

#include "audio/frame_assembler.h"
#include "audio/resampler.h"
#include "audio/segment_collector.h"
#include "audio/voice_activity_detector.h"
#include "core/bounded_queue.h"
#include "core/dictation_constants.h"
#include "correction/correction_engine.h"
#include "pipeline/recognizer.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace Pipeline {

struct PipelineConfig {
    int captureChannels{DictationConstants::DEFAULT_CAPTURE_CHANNELS};
    Resampler::Config resampler;       // inputRate = capture rate
    VoiceActivity::Config vad;         // sampleRate is forced to resampler.outputRate
    int maxSegmentMs{DictationConstants::DEFAULT_MAX_SEGMENT_MS};
    size_t recognizerQueueCapacity{DictationConstants::DEFAULT_RECOGNIZER_QUEUE_CAPACITY};
};

using TextSink = std::function<void(const Correction::CorrectionResult&)>;

class DictationPipeline {
   public:
    struct Stats {
        uint64_t framesProcessed{0};
        uint64_t segmentsEmitted{0};
        uint64_t segmentsDropped{0};      // Recognizer queue full
        uint64_t recognitionFailures{0};
        uint64_t emptyTranscripts{0};
        uint64_t transcriptsSubmitted{0};
        uint64_t transcriptsRejected{0};  // Correction queue full
    };

    // Throws DictationEngine::ConfigError for invalid audio or VAD settings
    DictationPipeline(const PipelineConfig& config, std::shared_ptr<Recognizer> recognizer,
                      std::shared_ptr<Correction::Engine> correction, TextSink sink);
    ~DictationPipeline();

    DictationPipeline(const DictationPipeline&) = delete;
    DictationPipeline& operator=(const DictationPipeline&) = delete;

    bool start();

    /**
     * @brief Feed captured interleaved audio (capture thread only)
     */
    void pushAudio(const float* interleaved, size_t frames);

    /**
     * @brief End of input: flush the partial frame and close any open segment
     */
    void finishInput();

    /**
     * @brief Drain queued segments and corrections, then stop the workers
     */
    void stop();

    bool isRunning() const {
        return running_.load();
    }

    VoiceActivity::Status lastStatus() const;

    Stats getStats() const;

   private:
    void processFrame(const float* frame, size_t count);
    void dispatchSegment(VoiceActivity::Segment segment);
    void recognizerLoop();
    std::chrono::steady_clock::time_point streamTime() const;

    PipelineConfig config_;
    std::shared_ptr<Recognizer> recognizer_;
    std::shared_ptr<Correction::Engine> correction_;
    TextSink sink_;

    // Capture-thread state
    Resampler::StreamingResampler resampler_;
    VoiceActivity::Detector vad_;
    VoiceActivity::FrameAssembler assembler_;
    VoiceActivity::SegmentCollector collector_;
    std::vector<float> mono_;
    std::chrono::steady_clock::time_point streamStart_;
    uint64_t frameIndex_{0};

    DictationEngine::BoundedQueue<VoiceActivity::Segment> segments_;
    std::atomic<bool> running_{false};
    std::thread recognizerThread_;

    mutable std::mutex statusMutex_;
    VoiceActivity::Status lastStatus_;

    std::atomic<uint64_t> framesProcessed_{0};
    std::atomic<uint64_t> segmentsEmitted_{0};
    std::atomic<uint64_t> segmentsDropped_{0};
    std::atomic<uint64_t> recognitionFailures_{0};
    std::atomic<uint64_t> emptyTranscripts_{0};
    std::atomic<uint64_t> transcriptsSubmitted_{0};
    std::atomic<uint64_t> transcriptsRejected_{0};
};

}  // namespace Pipeline
