#pragma once

#include "cli/CommandRunner.hpp"

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace lv::test {

// Replays queued results in order and records every argv it was asked to run
class FakeCommandRunner final : public cli::CommandRunner {
public:
    cli::CommandResult run(const std::vector<std::string>& argv) override {
        std::scoped_lock lock(mutex_);
        calls.push_back(argv);
        if (results_.empty()) return {1, "", "no scripted result"};
        auto r = results_.front();
        results_.pop_front();
        return r;
    }

    void push(int exitCode, std::string out, std::string err = {}) {
        std::scoped_lock lock(mutex_);
        results_.push_back({exitCode, std::move(out), std::move(err)});
    }

    std::vector<std::vector<std::string>> calls;

private:
    std::mutex mutex_;
    std::deque<cli::CommandResult> results_;
};

}
