///////////////////////////////////////////////////////////////////////////////
// stats_reporter.cpp -- /proc and sysfs sampling
///////////////////////////////////////////////////////////////////////////////

#include "stats_reporter.h"

#include <lp/common.h>

#include <dirent.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace lp::host {

namespace {

bool readFile(const std::string& path, std::string& out) {
    std::ifstream in(path);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

} // anonymous namespace

bool parseProcStat(const std::string& text, CpuTimes& out) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.compare(0, 4, "cpu ") != 0) continue;

        std::istringstream fields(line.substr(4));
        uint64_t v[8] = {};
        int n = 0;
        while (n < 8 && (fields >> v[n])) ++n;
        if (n < 4) return false;

        // user nice system idle iowait irq softirq steal
        out.total = 0;
        for (int i = 0; i < n; ++i) out.total += v[i];
        out.idle = v[3] + (n > 4 ? v[4] : 0);
        return true;
    }
    return false;
}

bool parseMemInfoUsedMb(const std::string& text, float& used_mb) {
    uint64_t total_kb = 0, avail_kb = 0;
    bool have_total = false, have_avail = false;

    std::istringstream lines(text);
    std::string key;
    uint64_t value = 0;
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        if (!(fields >> key >> value)) continue;
        if (key == "MemTotal:")     { total_kb = value; have_total = true; }
        if (key == "MemAvailable:") { avail_kb = value; have_avail = true; }
    }
    if (!have_total || !have_avail || avail_kb > total_kb) return false;

    used_mb = static_cast<float>(total_kb - avail_kb) / 1024.0f;
    return true;
}

StatsReporter::StatsReporter(std::string proc_root, std::string sys_root)
    : proc_root_(std::move(proc_root))
    , sys_root_(std::move(sys_root))
{
}

StatsMessage StatsReporter::sample(float fps) {
    std::lock_guard<std::mutex> lock(mutex_);

    StatsMessage msg;
    msg.fps = fps;

    std::string text;
    CpuTimes now;
    if (readFile(proc_root_ + "/stat", text) && parseProcStat(text, now)) {
        if (have_cpu_ && now.total > last_cpu_.total) {
            const uint64_t total = now.total - last_cpu_.total;
            const uint64_t idle  = (now.idle >= last_cpu_.idle) ? now.idle - last_cpu_.idle : 0;
            msg.cpu_percent = 100.0f * static_cast<float>(total - std::min(idle, total)) /
                              static_cast<float>(total);
        }
        last_cpu_ = now;
        have_cpu_ = true;
    }

    if (readFile(proc_root_ + "/meminfo", text)) {
        float used = 0.0f;
        if (parseMemInfoUsedMb(text, used)) msg.mem_used_mb = used;
    }

    float gpu = 0.0f;
    if (readGpuBusy(gpu)) msg.gpu_percent = gpu;

    return msg;
}

bool StatsReporter::readGpuBusy(float& percent) {
    if (!gpu_searched_) {
        gpu_searched_ = true;
        const std::string drm = sys_root_ + "/class/drm";
        if (DIR* dir = ::opendir(drm.c_str())) {
            while (dirent* entry = ::readdir(dir)) {
                std::string name = entry->d_name;
                if (name.compare(0, 4, "card") != 0 || name.find('-') != std::string::npos) {
                    continue;
                }
                std::string path = drm + "/" + name + "/device/gpu_busy_percent";
                std::string sample;
                if (readFile(path, sample)) {
                    gpu_path_ = path;
                    break;
                }
            }
            ::closedir(dir);
        }
        if (gpu_path_.empty()) {
            LP_LOG(DEBUG, "Stats: no gpu_busy_percent under %s", drm.c_str());
        }
    }

    if (gpu_path_.empty()) return false;

    std::string text;
    if (!readFile(gpu_path_, text)) return false;
    char* end = nullptr;
    long v = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str()) return false;
    percent = static_cast<float>(v);
    return true;
}

} // namespace lp::host
