#include <gtest/gtest.h>

#include <lp/util/child_process.h>

#include "test_util.h"

#include <csignal>

using namespace lp;

namespace {

bool waitExit(ChildProcess& child, int& code, uint32_t timeout_ms = 3000) {
    return test::waitFor([&] { return child.poll(code); }, timeout_ms);
}

} // namespace

TEST(ChildProcess, ReportsExitCode) {
    ChildProcess child;
    ASSERT_TRUE(child.start({"/bin/sh", "-c", "exit 7"}));
    EXPECT_TRUE(child.running());
    EXPECT_GT(child.pid(), 0);

    int code = 0;
    ASSERT_TRUE(waitExit(child, code));
    EXPECT_EQ(code, 7);
    EXPECT_FALSE(child.running());
    EXPECT_FALSE(child.poll(code));
}

TEST(ChildProcess, MissingProgramFailsToStart) {
    ChildProcess child;
    EXPECT_FALSE(child.start({"/nonexistent/linuxplay-no-such-binary"}));
    EXPECT_FALSE(child.running());
    EXPECT_FALSE(child.start({}));
}

TEST(ChildProcess, RefusesDoubleStart) {
    ChildProcess child;
    ASSERT_TRUE(child.start({"/bin/sh", "-c", "sleep 5"}));
    EXPECT_FALSE(child.start({"/bin/sh", "-c", "true"}));
    EXPECT_FALSE(child.stop(1000));
}

TEST(ChildProcess, TerminateReportsSignal) {
    ChildProcess child;
    ASSERT_TRUE(child.start({"sleep", "5"}));
    child.terminate();

    int code = 0;
    ASSERT_TRUE(waitExit(child, code));
    EXPECT_EQ(code, -SIGTERM);
}

TEST(ChildProcess, StopKillsProcessIgnoringTerm) {
    ChildProcess child;
    ASSERT_TRUE(child.start({"/bin/sh", "-c", "trap '' TERM; while :; do sleep 1; done"}));
    // Let the shell install its trap.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_TRUE(child.stop(100));
    EXPECT_FALSE(child.running());
}

TEST(ChildProcess, CaptureCommandOutput) {
    std::string out;
    ASSERT_TRUE(captureCommandOutput("printf 'a\\nb'", out));
    EXPECT_EQ(out, "a\nb");
    EXPECT_FALSE(captureCommandOutput("exit 3", out));
}

TEST(ChildProcess, ShellQuoteRoundTripsThroughShell) {
    const std::string nasty = "it's $HOME; `id` \"x\"";
    EXPECT_EQ(shellQuote("plain"), "'plain'");

    std::string out;
    ASSERT_TRUE(captureCommandOutput("printf %s " + shellQuote(nasty), out));
    EXPECT_EQ(out, nasty);
}
