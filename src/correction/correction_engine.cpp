/**
 * @file correction_engine.cpp
 * @brief Implementation of the rule-based correction engine
 */

#include "correction/correction_engine.h"

#include "logging/logger.h"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace Correction {

using DictationEngine::ErrorCode;

namespace {

class InputTooLong : public std::length_error {
   public:
    using std::length_error::length_error;
};

}  // namespace

Engine::Engine(const EngineConfig& config, RuleSet rules)
    : config_(config), rules_(std::move(rules)), queue_(config.queueCapacity) {}

Engine::~Engine() {
    shutdown();
}

bool Engine::initialize() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_.load()) {
        return false;
    }

    queue_.reopen();
    running_.store(true);
    worker_ = std::thread(&Engine::workerLoop, this);

    LOG_INFO("Correction engine started (rule-based: {}, queue capacity: {})",
             config_.enableRuleBased, queue_.capacity());
    return true;
}

void Engine::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_.load()) {
        return;
    }

    // Closing lets the worker drain what is already queued, then exit
    queue_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(false);

    const Stats stats = getStats();
    LOG_INFO("Correction engine stopped ({} processed, {} failed, avg {:.2f} ms)",
             stats.processed, stats.failed, stats.averageProcessingMs());
}

bool Engine::submit(std::string text, Callback callback) {
    if (!running_.load()) {
        initialize();
    }

    if (!queue_.tryPush(Task{std::move(text), std::move(callback)})) {
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.rejected++;
        }
        if (queue_.isClosed()) {
            LOG_WARN("Correction engine stopping, task rejected");
        } else {
            LOG_WARN("Correction queue full ({} tasks), task rejected", queue_.capacity());
        }
        return false;
    }
    return true;
}

CorrectionResult Engine::correct(const std::string& text) {
    return runTask(text);
}

Engine::Stats Engine::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

CorrectionResult Engine::applyRules(const std::string& text) const {
    if (text.size() > config_.maxTextLength) {
        throw InputTooLong("text length " + std::to_string(text.size()) + " exceeds limit " +
                           std::to_string(config_.maxTextLength));
    }

    CorrectionResult result;
    result.originalText = text;
    result.correctedText = text;

    if (config_.enableRuleBased) {
        std::string corrected = rules_.applyJargon(text, result.corrections);
        result.correctedText = rules_.applyHomophones(corrected, result.corrections);
    }

    result.confidence = result.corrections.empty() ? DictationConstants::CONFIDENCE_UNCHANGED
                                                   : DictationConstants::CONFIDENCE_CORRECTED;
    return result;
}

CorrectionResult Engine::runTask(const std::string& text) {
    const auto start = std::chrono::steady_clock::now();

    CorrectionResult result;
    try {
        result = applyRules(text);
    } catch (const InputTooLong& e) {
        LOG_ERROR("Correction failed: {}", e.what());
        result = CorrectionResult{};
        result.error = ErrorCode::CORRECTION_INPUT_TOO_LONG;
        result.errorMessage = e.what();
    } catch (const std::exception& e) {
        LOG_ERROR("Correction failed: {}", e.what());
        result = CorrectionResult{};
        result.error = ErrorCode::CORRECTION_TASK_FAILED;
        result.errorMessage = e.what();
    } catch (...) {
        LOG_ERROR("Correction failed: non-standard exception");
        result = CorrectionResult{};
        result.error = ErrorCode::CORRECTION_TASK_FAILED;
        result.errorMessage = "non-standard exception";
    }

    if (!result.ok()) {
        // Pass the text through unchanged so downstream delivery still happens
        result.originalText = text;
        result.correctedText = text;
        result.corrections.clear();
        result.confidence = DictationConstants::CONFIDENCE_FAILED;
    }

    result.processingTimeMs =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
            .count();
    recordResult(result);
    return result;
}

void Engine::recordResult(const CorrectionResult& result) {
    bool overBudget = false;
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.processed++;
        if (!result.ok()) {
            stats_.failed++;
        }
        stats_.totalProcessingMs += result.processingTimeMs;
        if (result.processingTimeMs > stats_.maxProcessingMs) {
            stats_.maxProcessingMs = result.processingTimeMs;
        }
        if (result.processingTimeMs > DictationConstants::CORRECTION_TARGET_LATENCY_MS) {
            stats_.overBudget++;
            overBudget = true;
        }
    }
    LOG_IF(WARN, overBudget, "Correction took {:.1f} ms (target {:.0f} ms)",
           result.processingTimeMs, DictationConstants::CORRECTION_TARGET_LATENCY_MS);
    LOG_IF(DEBUG, !result.corrections.empty(), "Corrected '{}' -> '{}' ({} replacements)",
           result.originalText, result.correctedText, result.corrections.size());
}

void Engine::workerLoop() {
    LOG_DEBUG("Correction worker started");

    Task task;
    while (queue_.pop(task)) {
        CorrectionResult result = runTask(task.text);
        if (task.callback) {
            try {
                task.callback(result);
            } catch (const std::exception& e) {
                LOG_ERROR("Correction callback threw: {}", e.what());
            } catch (...) {
                LOG_ERROR("Correction callback threw a non-standard exception");
            }
        }
        task = Task{};
    }

    LOG_DEBUG("Correction worker stopped");
}

}  // namespace Correction
