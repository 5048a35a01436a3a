/**
 * @file correction_engine.h
 * @brief Rule-based text correction with an ordered background worker
 *
 * Recognized text is corrected in two passes (jargon, then context-aware homophones).
 * submit() queues work for a single worker thread so results arrive in submission order;
 * correct() runs the same passes inline.
 */

#pragma once

#include "core/bounded_queue.h"
#include "core/dictation_constants.h"
#include "core/error_codes.h"
#include "correction/correction_rules.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Correction {

/**
 * @brief Outcome of correcting one utterance
 *
 * A failed task is reported as a pass-through: correctedText equals originalText,
 * no replacements, confidence 0.0 and `error` set.
 */
struct CorrectionResult {
    std::string originalText;
    std::string correctedText;
    float confidence{DictationConstants::CONFIDENCE_UNCHANGED};
    double processingTimeMs{0.0};
    std::vector<Replacement> corrections;
    DictationEngine::ErrorCode error{DictationEngine::ErrorCode::OK};
    std::string errorMessage;

    bool ok() const {
        return error == DictationEngine::ErrorCode::OK;
    }
};

struct EngineConfig {
    bool enableRuleBased{true};
    size_t queueCapacity{DictationConstants::DEFAULT_CORRECTION_QUEUE_CAPACITY};
    size_t maxTextLength{DictationConstants::DEFAULT_MAX_TEXT_LENGTH};
};

class Engine {
   public:
    using Callback = std::function<void(const CorrectionResult&)>;

    struct Stats {
        uint64_t processed{0};       // Tasks completed (sync and async)
        uint64_t failed{0};          // Tasks that produced an error result
        uint64_t rejected{0};        // submit() calls refused (queue full or stopped)
        uint64_t overBudget{0};      // Tasks slower than the latency target
        double totalProcessingMs{0.0};
        double maxProcessingMs{0.0};

        double averageProcessingMs() const {
            return processed > 0 ? totalProcessingMs / static_cast<double>(processed) : 0.0;
        }
    };

    explicit Engine(const EngineConfig& config = EngineConfig{},
                    RuleSet rules = RuleSet::defaults());
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @brief Start the background worker
     * @return false if already running
     */
    bool initialize();

    /**
     * @brief Stop accepting work, finish queued tasks, join the worker
     */
    void shutdown();

    /**
     * @brief Queue text for correction (never blocks)
     *
     * Starts the worker on first use. The callback runs on the worker thread, exactly once
     * per accepted task, in submission order.
     *
     * @return false when the queue is full or the engine is shutting down
     */
    bool submit(std::string text, Callback callback);

    /**
     * @brief Correct text on the calling thread without touching the queue
     */
    CorrectionResult correct(const std::string& text);

    bool isRunning() const {
        return running_.load();
    }

    size_t pendingTasks() const {
        return queue_.size();
    }

    Stats getStats() const;

    const RuleSet& rules() const {
        return rules_;
    }

   private:
    struct Task {
        std::string text;
        Callback callback;
    };

    // Runs both passes; throws on malformed input
    CorrectionResult applyRules(const std::string& text) const;

    // Never throws: failures become an error result
    CorrectionResult runTask(const std::string& text);

    void workerLoop();
    void recordResult(const CorrectionResult& result);

    EngineConfig config_;
    RuleSet rules_;

    DictationEngine::BoundedQueue<Task> queue_;
    std::atomic<bool> running_{false};
    std::mutex lifecycleMutex_;
    std::thread worker_;

    mutable std::mutex statsMutex_;
    Stats stats_;
};

}  // namespace Correction
