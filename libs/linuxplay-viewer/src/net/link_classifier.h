///////////////////////////////////////////////////////////////////////////////
// link_classifier.h -- LAN / Wi-Fi classification of the path to the host
//
//   1. `ip route get <host>` names the outgoing interface ("dev <iface>").
//   2. The interface is Wi-Fi if /sys/class/net/<iface>/wireless exists or
//      its name starts with "wl".
//   3. Anything else, including every failure along the way, is LAN.
//
// A manual --net lan|wifi override skips detection entirely.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/control/link_mode.h>

#include <string>

namespace lp {

/// Extract the interface following "dev" in `ip route get` output.
bool parseRouteDevice(const std::string& route_output, std::string& iface);

/// WIFI or LAN for a named interface.
LinkMode classifyInterface(const std::string& iface,
                           const std::string& sysfs_net = "/sys/class/net");

/// Full detection for the route to \p host.
LinkMode detectLinkMode(const std::string& host,
                        const std::string& sysfs_net = "/sys/class/net");

/// \p requested unless it is AUTO, in which case detectLinkMode().
LinkMode resolveLinkMode(LinkMode requested, const std::string& host);

} // namespace lp
