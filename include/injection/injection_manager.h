/**
 * @file injection_manager.h
 * @brief Clipboard-based text delivery into the focused application
 *
 * Each injection snapshots the clipboard, writes the text, simulates a paste with the first
 * strategy that works, and schedules a delayed restore of the snapshot on a background
 * thread. One injection runs at a time per manager; concurrent calls run in arrival order.
 */

#pragma once

#include "core/dictation_constants.h"
#include "core/error_codes.h"
#include "core/process_runner.h"
#include "injection/clipboard.h"
#include "injection/paste_strategy.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace TextInjection {

enum class InjectionOutcome {
    Pasted,         // A paste strategy succeeded
    ClipboardOnly,  // Text is on the clipboard, every paste strategy failed
    Failed,         // Clipboard write failed; nothing delivered
    Skipped,        // Empty text
};

const char* outcomeToString(InjectionOutcome outcome);

enum class AttemptStatus { Success, Failed, TimedOut, Unavailable };

const char* attemptStatusToString(AttemptStatus status);

struct StrategyAttempt {
    std::string name;
    AttemptStatus status{AttemptStatus::Failed};
    std::string detail;
    double elapsedMs{0.0};
};

struct InjectionReport {
    InjectionOutcome outcome{InjectionOutcome::Failed};
    std::string strategyUsed;  // Empty unless outcome is Pasted
    std::vector<StrategyAttempt> attempts;
    bool snapshotTaken{false};
    bool restoreScheduled{false};
    DictationEngine::ErrorCode error{DictationEngine::ErrorCode::OK};

    // Text reached the user, pasted or waiting on the clipboard
    bool delivered() const {
        return outcome == InjectionOutcome::Pasted || outcome == InjectionOutcome::ClipboardOnly;
    }
};

struct InjectionConfig {
    int strategyTimeoutMs{DictationConstants::DEFAULT_STRATEGY_TIMEOUT_MS};
    int restoreDelayMs{DictationConstants::DEFAULT_RESTORE_DELAY_MS};
    int clipboardSettleMs{DictationConstants::DEFAULT_CLIPBOARD_SETTLE_MS};
    bool appendTrailingSpace{true};
};

class Manager {
   public:
    struct Stats {
        uint64_t pasted{0};
        uint64_t clipboardOnly{0};
        uint64_t failed{0};
        uint64_t skipped{0};
        uint64_t restoresPerformed{0};
        uint64_t restoresSuperseded{0};
        uint64_t restoreFailures{0};
    };

    // Throws DictationEngine::ConfigError when clipboard or runner is null
    Manager(const InjectionConfig& config, std::shared_ptr<ClipboardBackend> clipboard,
            std::vector<PasteCommand> strategies,
            std::shared_ptr<Process::CommandRunner> runner);
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    /**
     * @brief Deliver text to the focused application
     *
     * Blocks for the clipboard round trip and at most one strategy timeout per strategy.
     * The clipboard restore runs later on the manager's thread, or immediately once the
     * manager has been shut down.
     */
    InjectionReport inject(const std::string& text);

    /**
     * @brief Run any pending restore now and stop the restore thread
     */
    void shutdown();

    // True while a restore is scheduled or being written
    bool hasPendingRestore() const;

    Stats getStats() const;

    const std::vector<PasteCommand>& strategies() const {
        return strategies_;
    }

   private:
    // FIFO mutex: lock() is granted in the order callers arrive. Meets BasicLockable.
    class TicketPermit {
       public:
        void lock();
        void unlock();

       private:
        std::mutex mutex_;
        std::condition_variable turnCv_;
        uint64_t nextTicket_{0};
        uint64_t servingTicket_{0};
    };

    struct PendingRestore {
        std::string snapshot;
        std::chrono::steady_clock::time_point due;
        uint64_t generation{0};
    };

    StrategyAttempt runStrategy(const PasteCommand& command);
    std::optional<std::string> readClipboard();
    bool writeClipboard(const std::string& text);
    void scheduleRestore(std::string snapshot);
    void performRestore(const std::string& snapshot);
    void restoreLoop();

    InjectionConfig config_;
    std::shared_ptr<ClipboardBackend> clipboard_;
    std::vector<PasteCommand> strategies_;
    std::shared_ptr<Process::CommandRunner> runner_;

    // Single in-flight permit; the restore thread takes it too before touching the clipboard
    TicketPermit injectPermit_;

    mutable std::mutex restoreMutex_;
    std::condition_variable restoreCv_;
    std::optional<PendingRestore> pending_;
    bool restoreInProgress_{false};
    bool stopping_{false};
    uint64_t generation_{0};
    std::atomic<bool> running_{false};
    std::thread restoreThread_;

    mutable std::mutex statsMutex_;
    Stats stats_;
};

}  // namespace TextInjection
