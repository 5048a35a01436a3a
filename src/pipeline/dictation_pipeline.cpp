/**
 * @file dictation_pipeline.cpp
 * @brief Implementation of the capture-to-text pipeline
 */

#include "pipeline/dictation_pipeline.h"

#include "audio/audio_utils.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <utility>

namespace Pipeline {

namespace {

VoiceActivity::Config vadConfigFor(const PipelineConfig& config) {
    VoiceActivity::Config vad = config.vad;
    vad.sampleRate = config.resampler.outputRate;
    return vad;
}

}  // namespace

DictationPipeline::DictationPipeline(const PipelineConfig& config,
                                     std::shared_ptr<Recognizer> recognizer,
                                     std::shared_ptr<Correction::Engine> correction,
                                     TextSink sink)
    : config_(config),
      recognizer_(std::move(recognizer)),
      correction_(std::move(correction)),
      sink_(std::move(sink)),
      resampler_(config.resampler),
      vad_(vadConfigFor(config)),
      assembler_(vad_.frameSize()),
      collector_(config.resampler.outputRate, config.maxSegmentMs),
      segments_(config.recognizerQueueCapacity) {
    if (config_.captureChannels <= 0) {
        throw DictationEngine::ConfigError(DictationEngine::ErrorCode::VALIDATION_INVALID_CONFIG,
                                           "capture channel count must be positive");
    }
    if (!recognizer_ || !correction_) {
        throw DictationEngine::ConfigError(DictationEngine::ErrorCode::VALIDATION_INVALID_CONFIG,
                                           "pipeline needs a recognizer and a correction engine");
    }

    VoiceActivity::Callbacks callbacks;
    callbacks.onSpeechStart = [this]() { collector_.begin(streamTime()); };
    callbacks.onPauseDetected = [](double pauseSeconds) {
        LOG_DEBUG("Pipeline: pause of {:.2f} s ends utterance", pauseSeconds);
    };
    callbacks.onSpeechEnd = [this]() {
        auto segment = collector_.end(streamTime());
        if (segment) {
            dispatchSegment(std::move(*segment));
        }
    };
    vad_.setCallbacks(std::move(callbacks));
}

DictationPipeline::~DictationPipeline() {
    stop();
}

bool DictationPipeline::start() {
    if (running_.load()) {
        LOG_WARN("Pipeline already running");
        return false;
    }

    segments_.reopen();
    correction_->initialize();
    streamStart_ = std::chrono::steady_clock::now();
    frameIndex_ = 0;

    running_.store(true);
    recognizerThread_ = std::thread(&DictationPipeline::recognizerLoop, this);

    LOG_INFO("Pipeline started ({} Hz x{} -> {} Hz, frame {} ms, pause {} ms, recognizer {})",
             config_.resampler.inputRate, config_.captureChannels, config_.resampler.outputRate,
             config_.vad.frameDurationMs, config_.vad.pauseThresholdMs, recognizer_->name());
    return true;
}

void DictationPipeline::pushAudio(const float* interleaved, size_t frames) {
    if (!interleaved || frames == 0) {
        return;
    }

    mono_.resize(frames);
    AudioUtils::downmixToMono(interleaved, mono_.data(), frames, config_.captureChannels);

    const std::vector<float> resampled = resampler_.resample(mono_.data(), frames);
    assembler_.push(resampled, [this](const float* frame, size_t count) {
        processFrame(frame, count);
    });
}

void DictationPipeline::finishInput() {
    assembler_.flush([this](const float* frame, size_t count) { processFrame(frame, count); });

    // Input ended mid-utterance: hand over what was said
    auto segment = collector_.end(streamTime());
    if (segment) {
        dispatchSegment(std::move(*segment));
    }
    vad_.reset();
    resampler_.reset();
}

void DictationPipeline::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Recognizer drains queued segments, then the correction engine drains its queue
    segments_.close();
    if (recognizerThread_.joinable()) {
        recognizerThread_.join();
    }
    correction_->shutdown();

    const Stats stats = getStats();
    LOG_INFO("Pipeline stopped ({} segments, {} transcripts, {} dropped, {} failed)",
             stats.segmentsEmitted, stats.transcriptsSubmitted, stats.segmentsDropped,
             stats.recognitionFailures);
}

VoiceActivity::Status DictationPipeline::lastStatus() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return lastStatus_;
}

DictationPipeline::Stats DictationPipeline::getStats() const {
    Stats stats;
    stats.framesProcessed = framesProcessed_.load();
    stats.segmentsEmitted = segmentsEmitted_.load();
    stats.segmentsDropped = segmentsDropped_.load();
    stats.recognitionFailures = recognitionFailures_.load();
    stats.emptyTranscripts = emptyTranscripts_.load();
    stats.transcriptsSubmitted = transcriptsSubmitted_.load();
    stats.transcriptsRejected = transcriptsRejected_.load();
    return stats;
}

std::chrono::steady_clock::time_point DictationPipeline::streamTime() const {
    // Audio time, not wall time, so file replay behaves like live capture
    const int64_t ns = static_cast<int64_t>(frameIndex_) *
                       static_cast<int64_t>(config_.vad.frameDurationMs) * 1000000;
    return streamStart_ + std::chrono::nanoseconds(ns);
}

void DictationPipeline::processFrame(const float* frame, size_t count) {
    const VoiceActivity::Status status = vad_.process(frame, count, streamTime());

    if (collector_.isCollecting()) {
        auto full = collector_.append(frame, count, streamTime());
        if (full) {
            dispatchSegment(std::move(*full));
        }
    }

    ++frameIndex_;
    framesProcessed_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(statusMutex_);
    lastStatus_ = status;
}

void DictationPipeline::dispatchSegment(VoiceActivity::Segment segment) {
    const uint64_t sequence = segment.sequence;
    const double duration = segment.durationSeconds();
    if (!segments_.tryPush(std::move(segment))) {
        segmentsDropped_.fetch_add(1);
        LOG_WARN("Pipeline: recognizer busy, dropped segment #{} ({:.2f} s)", sequence, duration);
        return;
    }
    segmentsEmitted_.fetch_add(1);
    LOG_DEBUG("Pipeline: segment #{} ({:.2f} s) queued for recognition", sequence, duration);
}

void DictationPipeline::recognizerLoop() {
    VoiceActivity::Segment segment;
    while (segments_.pop(segment)) {
        std::optional<std::string> text;
        try {
            text = recognizer_->transcribe(segment);
        } catch (const std::exception& e) {
            LOG_ERROR("Pipeline: recognizer threw on segment #{}: {}", segment.sequence, e.what());
        }

        if (!text) {
            recognitionFailures_.fetch_add(1);
            continue;
        }
        if (text->empty()) {
            emptyTranscripts_.fetch_add(1);
            LOG_DEBUG("Pipeline: segment #{} produced no text", segment.sequence);
            continue;
        }

        LOG_INFO("Recognized: \"{}\"", *text);
        if (correction_->submit(std::move(*text), sink_)) {
            transcriptsSubmitted_.fetch_add(1);
        } else {
            transcriptsRejected_.fetch_add(1);
        }
    }
}

}  // namespace Pipeline
