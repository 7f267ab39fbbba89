#include <gtest/gtest.h>

#include "stats/stats_reporter.h"

#include "test_util.h"

#include <sys/stat.h>

using namespace lp;
using namespace lp::host;

namespace {

const char* MEMINFO =
    "MemTotal:       16384000 kB\n"
    "MemFree:         1000000 kB\n"
    "MemAvailable:    8192000 kB\n";

std::string procStat(uint64_t user, uint64_t idle, uint64_t iowait) {
    return "cpu  " + std::to_string(user) + " 0 0 " + std::to_string(idle) + " " +
           std::to_string(iowait) + " 0 0 0 0 0\n"
           "cpu0 1 2 3 4 5 6 7 8 9 10\n";
}

} // namespace

TEST(StatsParsing, ProcStatCountsIowaitAsIdle) {
    CpuTimes t;
    ASSERT_TRUE(parseProcStat(procStat(100, 300, 50), t));
    EXPECT_EQ(t.total, 450u);
    EXPECT_EQ(t.idle, 350u);

    EXPECT_FALSE(parseProcStat("intr 1 2 3\n", t));
    EXPECT_FALSE(parseProcStat("cpu  1 2\n", t));
}

TEST(StatsParsing, MemInfoUsedMegabytes) {
    float used = 0.0f;
    ASSERT_TRUE(parseMemInfoUsedMb(MEMINFO, used));
    EXPECT_FLOAT_EQ(used, 8000.0f);
    EXPECT_FALSE(parseMemInfoUsedMb("MemTotal: 10 kB\n", used));
}

TEST(StatsReporter, SamplesFromRoots) {
    test::TempDir proc, sys;
    ASSERT_TRUE(test::writeText(proc.file("stat"), procStat(100, 900, 0)));
    ASSERT_TRUE(test::writeText(proc.file("meminfo"), MEMINFO));

    const std::string card = sys.path() + "/class/drm/card0/device";
    ASSERT_EQ(::mkdir((sys.path() + "/class").c_str(), 0755), 0);
    ASSERT_EQ(::mkdir((sys.path() + "/class/drm").c_str(), 0755), 0);
    ASSERT_EQ(::mkdir((sys.path() + "/class/drm/card0").c_str(), 0755), 0);
    ASSERT_EQ(::mkdir(card.c_str(), 0755), 0);
    ASSERT_TRUE(test::writeText(card + "/gpu_busy_percent", "42\n"));

    StatsReporter reporter(proc.path(), sys.path());
    StatsMessage first = reporter.sample(60.0f);
    EXPECT_FLOAT_EQ(first.cpu_percent, 0.0f);
    EXPECT_FLOAT_EQ(first.mem_used_mb, 8000.0f);
    EXPECT_FLOAT_EQ(first.gpu_percent, 42.0f);
    EXPECT_FLOAT_EQ(first.fps, 60.0f);

    // +300 busy, +100 idle since the first sample.
    ASSERT_TRUE(test::writeText(proc.file("stat"), procStat(400, 1000, 0)));
    StatsMessage second = reporter.sample(30.0f);
    EXPECT_FLOAT_EQ(second.cpu_percent, 75.0f);
}

TEST(StatsReporter, MissingSourcesReportZero) {
    test::TempDir empty;
    StatsReporter reporter(empty.path(), empty.path());
    StatsMessage m = reporter.sample(0.0f);
    EXPECT_FLOAT_EQ(m.cpu_percent, 0.0f);
    EXPECT_FLOAT_EQ(m.gpu_percent, 0.0f);
    EXPECT_FLOAT_EQ(m.mem_used_mb, 0.0f);
}
