///////////////////////////////////////////////////////////////////////////////
// stats_reporter.h -- Host resource usage for the STATS broadcast
//
// Samples CPU (from /proc/stat deltas), memory (MemTotal - MemAvailable
// from /proc/meminfo) and GPU busy percentage (the first
// /sys/class/drm/card*/device/gpu_busy_percent that exists).  The session
// manager sends one sample per second on the heartbeat channel.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/control/control_message.h>

#include <cstdint>
#include <mutex>
#include <string>

namespace lp::host {

struct CpuTimes {
    uint64_t idle  = 0;
    uint64_t total = 0;
};

/// Aggregate "cpu " line of /proc/stat.  iowait counts as idle.
bool parseProcStat(const std::string& text, CpuTimes& out);

/// Used memory in MiB from /proc/meminfo.
bool parseMemInfoUsedMb(const std::string& text, float& used_mb);

class StatsReporter {
public:
    /// Roots are prefixed to /proc and /sys paths.
    explicit StatsReporter(std::string proc_root = "/proc",
                           std::string sys_root = "/sys");

    StatsReporter(const StatsReporter&) = delete;
    StatsReporter& operator=(const StatsReporter&) = delete;

    /// Take a sample.  CPU usage is measured since the previous call; the
    /// first call reports 0.  Unavailable values are reported as 0.
    StatsMessage sample(float fps);

private:
    bool readGpuBusy(float& percent);

    const std::string proc_root_;
    const std::string sys_root_;

    std::mutex mutex_;
    CpuTimes   last_cpu_;
    bool       have_cpu_   = false;
    std::string gpu_path_;              // cached once found
    bool       gpu_searched_ = false;
};

} // namespace lp::host
