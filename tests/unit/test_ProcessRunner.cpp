#include <gtest/gtest.h>
#include "cli/ProcessRunner.hpp"

#include <chrono>
#include <thread>

using namespace lv::cli;
using namespace std::chrono_literals;

TEST(ProcessRunnerTest, CapturesOutputAndExitCode) {
    ProcessRunner runner;
    const auto r = runner.run({"sh", "-c", "echo out; echo err >&2; exit 3"});
    EXPECT_EQ(r.exitCode, 3);
    EXPECT_EQ(r.out, "out\n");
    EXPECT_EQ(r.err, "err\n");
}

TEST(ProcessRunnerTest, MissingProgramExits127) {
    ProcessRunner runner;
    const auto r = runner.run({"lazyvault-no-such-program"});
    EXPECT_EQ(r.exitCode, 127);
    EXPECT_FALSE(r.ok());
    EXPECT_NE(r.err.find("exec failed"), std::string::npos);
}

TEST(ProcessRunnerTest, EmptyArgvIsRejected) {
    ProcessRunner runner;
    EXPECT_EQ(runner.run({}).exitCode, -1);
}

TEST(ProcessRunnerTest, ShortCommandIsNotHeldBySlowSibling) {
    ProcessRunner runner;

    // the slow child is forked while the short command's pipes are open
    std::thread slow([&] {
        std::this_thread::sleep_for(50ms);
        EXPECT_TRUE(runner.run({"sleep", "3"}).ok());
    });

    const auto start = std::chrono::steady_clock::now();
    const auto r = runner.run({"sh", "-c", "sleep 0.3; echo done"});
    const auto elapsed = std::chrono::steady_clock::now() - start;
    slow.join();

    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.out, "done\n");
    EXPECT_LT(elapsed, 2s);
}
