/**
 * @file test_injection_manager.cpp
 * @brief Unit tests for clipboard snapshot, paste fallback and deferred restore
 */

#include "injection/injection_manager.h"
#include "injection_test_fakes.h"

#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace TextInjection;
using DictationEngine::ErrorCode;
using Status = Process::CommandResult::Status;

class InjectionManagerTest : public ::testing::Test {
   protected:
    std::shared_ptr<FakeClipboard> clipboard = std::make_shared<FakeClipboard>("user data");
    std::shared_ptr<FakeRunner> runner = std::make_shared<FakeRunner>();

    InjectionConfig fastConfig(int restoreDelayMs = 50) {
        InjectionConfig config;
        config.restoreDelayMs = restoreDelayMs;
        config.clipboardSettleMs = 0;
        config.strategyTimeoutMs = 100;
        return config;
    }

    static std::vector<PasteCommand> twoStrategies() {
        return {{"first", {"paste-one"}}, {"second", {"paste-two"}}};
    }

    std::unique_ptr<Manager> makeManager(const InjectionConfig& config) {
        return std::make_unique<Manager>(config, clipboard, twoStrategies(), runner);
    }

    static bool waitForRestore(const Manager& manager,
                               std::chrono::milliseconds limit = std::chrono::seconds(3)) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (manager.hasPendingRestore()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }
};

TEST_F(InjectionManagerTest, PastesWithFirstWorkingStrategy) {
    runner->setResult("paste-one", Status::Ok);
    auto manager = makeManager(fastConfig());

    auto report = manager->inject("hello world");
    EXPECT_EQ(report.outcome, InjectionOutcome::Pasted);
    EXPECT_EQ(report.strategyUsed, "first");
    ASSERT_EQ(report.attempts.size(), 1u);
    EXPECT_EQ(report.attempts[0].status, AttemptStatus::Success);
    EXPECT_TRUE(report.snapshotTaken);
    EXPECT_TRUE(report.restoreScheduled);
    EXPECT_TRUE(report.delivered());
    EXPECT_EQ(report.error, ErrorCode::OK);

    // Text goes to the clipboard with a trailing space
    ASSERT_FALSE(clipboard->writes().empty());
    EXPECT_EQ(clipboard->writes()[0], "hello world ");
}

TEST_F(InjectionManagerTest, FallsBackToNextStrategy) {
    runner->setResult("paste-one", Status::Failed, 1);
    runner->setResult("paste-two", Status::Ok);
    auto manager = makeManager(fastConfig());

    auto report = manager->inject("text");
    EXPECT_EQ(report.outcome, InjectionOutcome::Pasted);
    EXPECT_EQ(report.strategyUsed, "second");
    ASSERT_EQ(report.attempts.size(), 2u);
    EXPECT_EQ(report.attempts[0].status, AttemptStatus::Failed);
    EXPECT_EQ(report.attempts[0].detail, "exit code 1");
    EXPECT_EQ(report.attempts[1].status, AttemptStatus::Success);
}

TEST_F(InjectionManagerTest, ReportsUnavailableAndTimedOutStrategies) {
    runner->setResult("paste-two", Status::TimedOut);
    auto manager = makeManager(fastConfig());

    auto report = manager->inject("text");
    ASSERT_EQ(report.attempts.size(), 2u);
    EXPECT_EQ(report.attempts[0].status, AttemptStatus::Unavailable);
    EXPECT_EQ(report.attempts[1].status, AttemptStatus::TimedOut);
}

TEST_F(InjectionManagerTest, AllStrategiesFailLeavesTextThenRestores) {
    runner->setResult("paste-one", Status::Failed, 1);
    runner->setResult("paste-two", Status::Failed, 2);
    auto manager = makeManager(fastConfig(50));

    auto report = manager->inject("dictated text");
    EXPECT_EQ(report.outcome, InjectionOutcome::ClipboardOnly);
    EXPECT_EQ(report.error, ErrorCode::INJECTION_ALL_STRATEGIES_FAILED);
    EXPECT_TRUE(report.delivered());
    EXPECT_EQ(report.attempts.size(), 2u);
    EXPECT_EQ(clipboard->content(), "dictated text ");

    ASSERT_TRUE(waitForRestore(*manager));
    EXPECT_EQ(clipboard->content(), "user data");
    EXPECT_EQ(manager->getStats().clipboardOnly, 1u);
    EXPECT_EQ(manager->getStats().restoresPerformed, 1u);
}

TEST_F(InjectionManagerTest, RestoreWaitsForDelay) {
    runner->setResult("paste-one", Status::Ok);
    auto manager = makeManager(fastConfig(300));

    manager->inject("text");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(manager->hasPendingRestore());
    EXPECT_EQ(clipboard->content(), "text ");

    ASSERT_TRUE(waitForRestore(*manager));
    EXPECT_EQ(clipboard->content(), "user data");
}

TEST_F(InjectionManagerTest, BackToBackInjectionsRestoreOriginalContent) {
    runner->setResult("paste-one", Status::Ok);
    auto manager = makeManager(fastConfig(200));

    manager->inject("first");
    auto second = manager->inject("second");
    EXPECT_TRUE(second.snapshotTaken);
    // Only the first attempt read the clipboard; the second adopted its snapshot
    EXPECT_EQ(clipboard->reads(), 1);

    ASSERT_TRUE(waitForRestore(*manager));
    EXPECT_EQ(clipboard->content(), "user data");

    auto stats = manager->getStats();
    EXPECT_EQ(stats.pasted, 2u);
    EXPECT_EQ(stats.restoresSuperseded, 1u);
    EXPECT_EQ(stats.restoresPerformed, 1u);
}

TEST_F(InjectionManagerTest, EmptyTextIsSkipped) {
    auto manager = makeManager(fastConfig());

    auto report = manager->inject("");
    EXPECT_EQ(report.outcome, InjectionOutcome::Skipped);
    report = manager->inject("  \t\n");
    EXPECT_EQ(report.outcome, InjectionOutcome::Skipped);
    EXPECT_FALSE(report.delivered());

    EXPECT_EQ(clipboard->reads(), 0);
    EXPECT_TRUE(clipboard->writes().empty());
    EXPECT_TRUE(runner->calls().empty());
    EXPECT_EQ(manager->getStats().skipped, 2u);
}

TEST_F(InjectionManagerTest, ClipboardWriteFailureIsReported) {
    clipboard->setFailWrites(true);
    runner->setResult("paste-one", Status::Ok);
    auto manager = makeManager(fastConfig());

    auto report = manager->inject("text");
    EXPECT_EQ(report.outcome, InjectionOutcome::Failed);
    EXPECT_EQ(report.error, ErrorCode::INJECTION_CLIPBOARD_WRITE_FAILED);
    EXPECT_FALSE(report.delivered());
    EXPECT_TRUE(report.attempts.empty());
    EXPECT_TRUE(runner->calls().empty());
    EXPECT_EQ(manager->getStats().failed, 1u);
}

TEST_F(InjectionManagerTest, UnreadableClipboardSkipsRestore) {
    clipboard->setFailReads(true);
    runner->setResult("paste-one", Status::Ok);
    auto manager = makeManager(fastConfig());

    auto report = manager->inject("text");
    EXPECT_EQ(report.outcome, InjectionOutcome::Pasted);
    EXPECT_FALSE(report.snapshotTaken);
    EXPECT_FALSE(report.restoreScheduled);
    EXPECT_FALSE(manager->hasPendingRestore());
}

TEST_F(InjectionManagerTest, TrailingSpaceCanBeDisabled) {
    runner->setResult("paste-one", Status::Ok);
    auto config = fastConfig();
    config.appendTrailingSpace = false;
    auto manager = makeManager(config);

    manager->inject("exact");
    EXPECT_EQ(clipboard->writes()[0], "exact");
}

TEST_F(InjectionManagerTest, ShutdownRestoresImmediately) {
    runner->setResult("paste-one", Status::Ok);
    auto manager = makeManager(fastConfig(60000));

    manager->inject("text");
    EXPECT_EQ(clipboard->content(), "text ");

    const auto start = std::chrono::steady_clock::now();
    manager->shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_EQ(clipboard->content(), "user data");
    EXPECT_FALSE(manager->hasPendingRestore());
}

TEST_F(InjectionManagerTest, ConcurrentInjectionsAreSerialized) {
    runner->setResult("paste-one", Status::Ok);
    runner->setDelay(std::chrono::milliseconds(30));
    auto manager = makeManager(fastConfig(100));

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&manager, i] { manager->inject("text " + std::to_string(i)); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(runner->maxActive(), 1);
    EXPECT_EQ(manager->getStats().pasted, 4u);

    ASSERT_TRUE(waitForRestore(*manager));
    EXPECT_EQ(clipboard->content(), "user data");
}

TEST_F(InjectionManagerTest, ConcurrentInjectionsRunInArrivalOrder) {
    runner->setResult("paste-one", Status::Ok);
    runner->setDelay(std::chrono::milliseconds(200));
    auto manager = makeManager(fastConfig(60000));

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&manager, i] { manager->inject("text " + std::to_string(i)); });
        // Each caller is queued before the next one starts
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    for (auto& t : threads) {
        t.join();
    }

    auto writes = clipboard->writes();
    ASSERT_EQ(writes.size(), 4u);
    EXPECT_EQ(writes[0], "text 0 ");
    EXPECT_EQ(writes[1], "text 1 ");
    EXPECT_EQ(writes[2], "text 2 ");
    EXPECT_EQ(writes[3], "text 3 ");

    manager->shutdown();
    EXPECT_EQ(clipboard->content(), "user data");
}

TEST_F(InjectionManagerTest, InjectAfterShutdownRestoresWithoutDelay) {
    runner->setResult("paste-one", Status::Ok);
    auto manager = makeManager(fastConfig(60000));
    manager->shutdown();

    const auto start = std::chrono::steady_clock::now();
    auto report = manager->inject("late text");
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));

    EXPECT_EQ(report.outcome, InjectionOutcome::Pasted);
    EXPECT_TRUE(report.restoreScheduled);
    EXPECT_EQ(clipboard->content(), "user data");
    EXPECT_FALSE(manager->hasPendingRestore());
    EXPECT_EQ(manager->getStats().restoresPerformed, 1u);
}

TEST_F(InjectionManagerTest, NullCollaboratorsAreRejected) {
    EXPECT_THROW({ Manager manager(fastConfig(), clipboard, twoStrategies(), nullptr); },
                 DictationEngine::ConfigError);
    EXPECT_THROW({ Manager manager(fastConfig(), nullptr, twoStrategies(), runner); },
                 DictationEngine::ConfigError);

    try {
        Manager manager(fastConfig(), clipboard, twoStrategies(), nullptr);
        FAIL() << "expected ConfigError";
    } catch (const DictationEngine::ConfigError& e) {
        EXPECT_EQ(e.code(), ErrorCode::VALIDATION_INVALID_CONFIG);
    }
}

TEST_F(InjectionManagerTest, StrategyReceivesConfiguredTimeout) {
    runner->setResult("paste-one", Status::Ok);
    auto config = fastConfig();
    config.strategyTimeoutMs = 250;
    auto manager = makeManager(config);

    manager->inject("text");
    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(calls[0].argv, std::vector<std::string>{"paste-one"});
}

TEST(InjectionNames, OutcomeAndAttemptStatus) {
    EXPECT_STREQ(outcomeToString(InjectionOutcome::ClipboardOnly), "clipboard_only");
    EXPECT_STREQ(attemptStatusToString(AttemptStatus::Unavailable), "unavailable");
}
