/**
 * @file injection_manager.cpp
 * @brief Implementation of clipboard-based text injection
 */

#include "injection/injection_manager.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace TextInjection {

using DictationEngine::ErrorCode;
using SteadyClock = std::chrono::steady_clock;

namespace {

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string firstLine(const std::string& text) {
    const size_t end = text.find_first_of("\r\n");
    return text.substr(0, end);
}

double elapsedMs(SteadyClock::time_point start) {
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - start).count();
}

}  // namespace

const char* outcomeToString(InjectionOutcome outcome) {
    switch (outcome) {
    case InjectionOutcome::Pasted:
        return "pasted";
    case InjectionOutcome::ClipboardOnly:
        return "clipboard_only";
    case InjectionOutcome::Failed:
        return "failed";
    case InjectionOutcome::Skipped:
        return "skipped";
    }
    return "unknown";
}

const char* attemptStatusToString(AttemptStatus status) {
    switch (status) {
    case AttemptStatus::Success:
        return "success";
    case AttemptStatus::Failed:
        return "failed";
    case AttemptStatus::TimedOut:
        return "timed_out";
    case AttemptStatus::Unavailable:
        return "unavailable";
    }
    return "unknown";
}

Manager::Manager(const InjectionConfig& config, std::shared_ptr<ClipboardBackend> clipboard,
                 std::vector<PasteCommand> strategies,
                 std::shared_ptr<Process::CommandRunner> runner)
    : config_(config),
      clipboard_(std::move(clipboard)),
      strategies_(std::move(strategies)),
      runner_(std::move(runner)) {
    if (!clipboard_) {
        throw DictationEngine::ConfigError(ErrorCode::VALIDATION_INVALID_CONFIG,
                                           "Injection manager requires a clipboard backend");
    }
    if (!runner_) {
        throw DictationEngine::ConfigError(ErrorCode::VALIDATION_INVALID_CONFIG,
                                           "Injection manager requires a command runner");
    }

    running_.store(true);
    restoreThread_ = std::thread(&Manager::restoreLoop, this);

    std::string names;
    for (const auto& strategy : strategies_) {
        names += names.empty() ? strategy.name : ", " + strategy.name;
    }
    LOG_INFO("Injection manager ready (clipboard: {}, strategies: [{}])",
             clipboard_->name(), names);
}

Manager::~Manager() {
    shutdown();
}

void Manager::TicketPermit::lock() {
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t ticket = nextTicket_++;
    turnCv_.wait(lock, [this, ticket] { return servingTicket_ == ticket; });
}

void Manager::TicketPermit::unlock() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++servingTicket_;
    }
    turnCv_.notify_all();
}

InjectionReport Manager::inject(const std::string& text) {
    std::lock_guard<TicketPermit> permit(injectPermit_);

    InjectionReport report;
    if (text.empty() || isBlank(text)) {
        LOG_WARN("Injection: empty text, nothing to deliver");
        report.outcome = InjectionOutcome::Skipped;
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.skipped++;
        return report;
    }

    const std::string payload = config_.appendTrailingSpace ? text + " " : text;

    // 1. Snapshot. A pending restore means the clipboard still holds our previous text, so
    //    its snapshot (the user's content) carries over to this attempt.
    std::optional<std::string> snapshot;
    bool adopted = false;
    {
        std::lock_guard<std::mutex> lock(restoreMutex_);
        if (pending_) {
            snapshot = std::move(pending_->snapshot);
            pending_.reset();
            ++generation_;
            adopted = true;
        }
    }
    if (adopted) {
        LOG_DEBUG("Injection: superseding pending clipboard restore");
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.restoresSuperseded++;
    } else {
        snapshot = readClipboard();
        if (!snapshot) {
            LOG_WARN("Injection: clipboard snapshot unavailable, restore will be skipped");
        }
    }
    report.snapshotTaken = snapshot.has_value();

    // 2. Put the text on the clipboard
    if (!writeClipboard(payload)) {
        LOG_ERROR("Injection: clipboard write failed, text not delivered");
        report.outcome = InjectionOutcome::Failed;
        report.error = ErrorCode::INJECTION_CLIPBOARD_WRITE_FAILED;
        if (snapshot) {
            scheduleRestore(std::move(*snapshot));
            report.restoreScheduled = true;
        }
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.failed++;
        return report;
    }

    if (config_.clipboardSettleMs > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.clipboardSettleMs));
    }

    // 3. Paste with the first strategy that works
    for (const auto& strategy : strategies_) {
        StrategyAttempt attempt = runStrategy(strategy);
        const bool success = attempt.status == AttemptStatus::Success;
        report.attempts.push_back(std::move(attempt));
        if (success) {
            report.outcome = InjectionOutcome::Pasted;
            report.strategyUsed = strategy.name;
            break;
        }
    }

    // 4. Every strategy failed: the text stays on the clipboard for a manual paste
    if (report.outcome != InjectionOutcome::Pasted) {
        report.outcome = InjectionOutcome::ClipboardOnly;
        report.error = ErrorCode::INJECTION_ALL_STRATEGIES_FAILED;
        LOG_WARN("Injection: no paste strategy succeeded ({} tried), text left on clipboard",
                 report.attempts.size());
    } else {
        LOG_DEBUG("Injection: pasted {} chars via {}", payload.size(), report.strategyUsed);
    }

    // 5. Deferred restore
    if (snapshot) {
        scheduleRestore(std::move(*snapshot));
        report.restoreScheduled = true;
    }

    std::lock_guard<std::mutex> lock(statsMutex_);
    if (report.outcome == InjectionOutcome::Pasted) {
        stats_.pasted++;
    } else {
        stats_.clipboardOnly++;
    }
    return report;
}

StrategyAttempt Manager::runStrategy(const PasteCommand& command) {
    StrategyAttempt attempt;
    attempt.name = command.name;

    Process::CommandRequest request;
    request.argv = command.argv;
    request.timeout = std::chrono::milliseconds(config_.strategyTimeoutMs);

    const auto start = SteadyClock::now();
    const Process::CommandResult result = runner_->run(request);
    attempt.elapsedMs = elapsedMs(start);

    switch (result.status) {
    case Process::CommandResult::Status::Ok:
        attempt.status = AttemptStatus::Success;
        break;
    case Process::CommandResult::Status::NotFound:
        attempt.status = AttemptStatus::Unavailable;
        attempt.detail = command.argv.empty() ? "empty command" : command.argv[0] + " not found";
        break;
    case Process::CommandResult::Status::TimedOut:
        attempt.status = AttemptStatus::TimedOut;
        attempt.detail = "timed out after " + std::to_string(config_.strategyTimeoutMs) + " ms";
        break;
    case Process::CommandResult::Status::Failed:
    case Process::CommandResult::Status::SpawnError:
        attempt.status = AttemptStatus::Failed;
        attempt.detail = result.errorOutput.empty()
                             ? "exit code " + std::to_string(result.exitCode)
                             : firstLine(result.errorOutput);
        break;
    }

    LOG_IF(DEBUG, attempt.status != AttemptStatus::Success, "Injection: strategy {} {}: {}",
           attempt.name, attemptStatusToString(attempt.status), attempt.detail);
    return attempt;
}

std::optional<std::string> Manager::readClipboard() {
    try {
        return clipboard_->read();
    } catch (const std::exception& e) {
        LOG_WARN("Injection: clipboard read threw: {}", e.what());
        return std::nullopt;
    }
}

bool Manager::writeClipboard(const std::string& text) {
    try {
        return clipboard_->write(text);
    } catch (const std::exception& e) {
        LOG_WARN("Injection: clipboard write threw: {}", e.what());
        return false;
    }
}

void Manager::scheduleRestore(std::string snapshot) {
    if (!running_.load()) {
        // Restore thread is gone and the caller holds the permit; restore now
        LOG_DEBUG("Injection: manager stopped, restoring clipboard without delay");
        performRestore(snapshot);
        return;
    }

    const auto due = SteadyClock::now() + std::chrono::milliseconds(config_.restoreDelayMs);

    {
        std::lock_guard<std::mutex> lock(restoreMutex_);
        pending_ = PendingRestore{std::move(snapshot), due, ++generation_};
    }
    restoreCv_.notify_all();
}

void Manager::performRestore(const std::string& snapshot) {
    const bool ok = writeClipboard(snapshot);
    LOG_IF(WARN, !ok, "Injection: clipboard restore failed");
    std::lock_guard<std::mutex> lock(statsMutex_);
    if (ok) {
        stats_.restoresPerformed++;
    } else {
        stats_.restoreFailures++;
    }
}

void Manager::restoreLoop() {
    std::unique_lock<std::mutex> lock(restoreMutex_);
    while (!stopping_) {
        if (!pending_) {
            restoreCv_.wait(lock, [this] { return stopping_ || pending_.has_value(); });
            continue;
        }

        const uint64_t generation = pending_->generation;
        const auto due = pending_->due;
        const bool interrupted = restoreCv_.wait_until(lock, due, [this, generation] {
            return stopping_ || !pending_ || pending_->generation != generation;
        });
        if (interrupted) {
            // Stopping (shutdown flushes), or superseded by a newer injection
            continue;
        }

        // Lock order is permit first, then restoreMutex_
        lock.unlock();
        std::unique_lock<TicketPermit> permit(injectPermit_);
        lock.lock();
        if (!pending_ || pending_->generation != generation) {
            continue;
        }
        std::string snapshot = std::move(pending_->snapshot);
        pending_.reset();
        restoreInProgress_ = true;
        lock.unlock();

        performRestore(snapshot);
        LOG_DEBUG("Injection: clipboard restored ({} bytes)", snapshot.size());

        permit.unlock();
        lock.lock();
        restoreInProgress_ = false;
    }
}

void Manager::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(restoreMutex_);
        stopping_ = true;
    }
    restoreCv_.notify_all();
    if (restoreThread_.joinable()) {
        restoreThread_.join();
    }

    // Never leave dictated text on the user's clipboard
    std::lock_guard<TicketPermit> permit(injectPermit_);
    std::optional<std::string> snapshot;
    {
        std::lock_guard<std::mutex> lock(restoreMutex_);
        if (pending_) {
            snapshot = std::move(pending_->snapshot);
            pending_.reset();
        }
    }
    if (snapshot) {
        LOG_INFO("Injection: restoring clipboard before shutdown");
        performRestore(*snapshot);
    }

    const Stats stats = getStats();
    LOG_INFO("Injection manager stopped ({} pasted, {} clipboard-only, {} failed)", stats.pasted,
             stats.clipboardOnly, stats.failed);
}

bool Manager::hasPendingRestore() const {
    std::lock_guard<std::mutex> lock(restoreMutex_);
    return pending_.has_value() || restoreInProgress_;
}

Manager::Stats Manager::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

}  // namespace TextInjection
