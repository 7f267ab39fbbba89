///////////////////////////////////////////////////////////////////////////////
// monitor_layout.cpp -- xrandr monitor parsing
///////////////////////////////////////////////////////////////////////////////

#include "monitor_layout.h"

#include <lp/common.h>
#include <lp/util/child_process.h>

#include <cstdlib>
#include <sstream>

namespace lp::host {

namespace {

// Parse a decimal prefix of s starting at pos.  Advances pos.
bool readNumber(const std::string& s, size_t& pos, long& out) {
    size_t start = pos;
    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) ++pos;
    size_t digits = pos;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') ++pos;
    if (pos == digits) return false;
    out = std::strtol(s.substr(start, pos - start).c_str(), nullptr, 10);
    return true;
}

// "2560/597x1440/336+0+0" -> geometry.  The physical sizes after '/' are
// optional.
bool parseGeometryToken(const std::string& tok, MonitorGeometry& out) {
    size_t pos = 0;
    long w = 0, h = 0, x = 0, y = 0, ignored = 0;

    if (!readNumber(tok, pos, w)) return false;
    if (pos < tok.size() && tok[pos] == '/') {
        ++pos;
        if (!readNumber(tok, pos, ignored)) return false;
    }
    if (pos >= tok.size() || tok[pos] != 'x') return false;
    ++pos;
    if (!readNumber(tok, pos, h)) return false;
    if (pos < tok.size() && tok[pos] == '/') {
        ++pos;
        if (!readNumber(tok, pos, ignored)) return false;
    }
    if (pos >= tok.size() || (tok[pos] != '+' && tok[pos] != '-')) return false;
    if (!readNumber(tok, pos, x)) return false;
    if (pos >= tok.size() || (tok[pos] != '+' && tok[pos] != '-')) return false;
    if (!readNumber(tok, pos, y)) return false;
    if (pos != tok.size() || w <= 0 || h <= 0) return false;

    out.width  = static_cast<uint32_t>(w);
    out.height = static_cast<uint32_t>(h);
    out.x      = static_cast<int32_t>(x);
    out.y      = static_cast<int32_t>(y);
    return true;
}

} // anonymous namespace

std::vector<MonitorGeometry> parseXrandrMonitors(const std::string& output) {
    std::vector<MonitorGeometry> monitors;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream tokens(line);
        std::string index, name, geometry;
        if (!(tokens >> index >> name >> geometry)) continue;
        if (index.empty() || index.back() != ':') continue;

        MonitorGeometry g;
        if (parseGeometryToken(geometry, g)) monitors.push_back(g);
    }
    return monitors;
}

std::vector<MonitorGeometry> detectMonitors(const std::string& display) {
    std::string output;
    const std::string cmd = "DISPLAY=" + shellQuote(display) +
                            " xrandr --listmonitors 2>/dev/null";
    std::vector<MonitorGeometry> monitors;
    if (captureCommandOutput(cmd, output)) {
        monitors = parseXrandrMonitors(output);
    } else {
        LP_LOG(WARN, "xrandr --listmonitors failed on DISPLAY=%s", display.c_str());
    }

    if (monitors.empty()) {
        LP_LOG(WARN, "No monitors detected, assuming a single 1920x1080+0+0");
        monitors.push_back(MonitorGeometry{});
    }

    for (size_t i = 0; i < monitors.size(); ++i) {
        LP_LOG(INFO, "Monitor %zu: %s", i, monitors[i].toString().c_str());
    }
    return monitors;
}

} // namespace lp::host
