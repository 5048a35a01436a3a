#pragma once

#include "core/process_runner.h"
#include "injection/clipboard.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// In-memory clipboard with switchable failures
class FakeClipboard : public TextInjection::ClipboardBackend {
   public:
    explicit FakeClipboard(std::string initial = "") : content_(std::move(initial)) {}

    std::optional<std::string> read() override {
        std::lock_guard<std::mutex> lock(mutex_);
        reads_++;
        if (failReads_) {
            return std::nullopt;
        }
        return content_;
    }

    bool write(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failWrites_) {
            return false;
        }
        content_ = text;
        writes_.push_back(text);
        return true;
    }

    std::string name() const override {
        return "fake";
    }

    std::string content() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return content_;
    }
    std::vector<std::string> writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }
    int reads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reads_;
    }
    void setFailReads(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failReads_ = fail;
    }
    void setFailWrites(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failWrites_ = fail;
    }

   private:
    mutable std::mutex mutex_;
    std::string content_;
    std::vector<std::string> writes_;
    int reads_ = 0;
    bool failReads_ = false;
    bool failWrites_ = false;
};

// Command runner answering by executable name; unknown executables are NotFound
class FakeRunner : public Process::CommandRunner {
   public:
    using Status = Process::CommandResult::Status;

    void setResult(const std::string& executable, Status status, int exitCode = 0,
                   std::string output = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        Process::CommandResult result;
        result.status = status;
        result.exitCode = exitCode;
        result.output = std::move(output);
        results_[executable] = result;
    }

    void setDelay(std::chrono::milliseconds delay) {
        delay_ = delay;
    }

    Process::CommandResult run(const Process::CommandRequest& request) override {
        const int active = ++active_;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            maxActive_ = std::max(maxActive_, active);
            calls_.push_back(request);
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        --active_;

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = request.argv.empty() ? results_.end() : results_.find(request.argv[0]);
        if (it == results_.end()) {
            Process::CommandResult missing;
            missing.status = Status::NotFound;
            return missing;
        }
        return it->second;
    }

    std::vector<Process::CommandRequest> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }
    int maxActive() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return maxActive_;
    }

   private:
    mutable std::mutex mutex_;
    std::map<std::string, Process::CommandResult> results_;
    std::vector<Process::CommandRequest> calls_;
    std::chrono::milliseconds delay_{0};
    std::atomic<int> active_{0};
    int maxActive_ = 0;
};
