///////////////////////////////////////////////////////////////////////////////
// monitor_layout.h -- X11 monitor geometry discovery
//
// Parses `xrandr --listmonitors` on the configured DISPLAY:
//
//   Monitors: 2
//    0: +*DP-1 2560/597x1440/336+0+0  DP-1
//    1: +HDMI-1 1920/527x1080/296+2560+0  HDMI-1
//
// Monitor order is the order xrandr lists them in, which is also the
// index a viewer uses to select a monitor.  If xrandr is missing or
// reports nothing usable, a single 1920x1080+0+0 monitor is assumed.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/control/handshake.h>

#include <string>
#include <vector>

namespace lp::host {

/// Parse the output of `xrandr --listmonitors`.  Lines that do not carry a
/// geometry are skipped.
std::vector<MonitorGeometry> parseXrandrMonitors(const std::string& output);

/// Query xrandr on \p display.  Never returns an empty list.
std::vector<MonitorGeometry> detectMonitors(const std::string& display);

} // namespace lp::host
