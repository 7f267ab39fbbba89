///////////////////////////////////////////////////////////////////////////////
// link_classifier.cpp -- Route and sysfs based link detection
///////////////////////////////////////////////////////////////////////////////

#include "link_classifier.h"

#include <lp/common.h>
#include <lp/util/child_process.h>

#include <sys/stat.h>

#include <sstream>

namespace lp {

bool parseRouteDevice(const std::string& route_output, std::string& iface) {
    std::istringstream in(route_output);
    std::string tok;
    while (in >> tok) {
        if (tok == "dev") {
            std::string name;
            if (!(in >> name) || name.empty()) return false;
            iface = name;
            return true;
        }
    }
    return false;
}

LinkMode classifyInterface(const std::string& iface, const std::string& sysfs_net) {
    if (iface.empty() || iface.find('/') != std::string::npos) return LinkMode::LAN;

    struct stat st;
    const std::string wireless = sysfs_net + "/" + iface + "/wireless";
    if (::stat(wireless.c_str(), &st) == 0) return LinkMode::WIFI;

    if (iface.compare(0, 2, "wl") == 0) return LinkMode::WIFI;
    return LinkMode::LAN;
}

LinkMode detectLinkMode(const std::string& host, const std::string& sysfs_net) {
    std::string output;
    if (!captureCommandOutput("ip route get " + shellQuote(host) + " 2>/dev/null", output)) {
        LP_LOG(DEBUG, "Link: 'ip route get %s' failed, assuming LAN", host.c_str());
        return LinkMode::LAN;
    }

    std::string iface;
    if (!parseRouteDevice(output, iface)) {
        LP_LOG(DEBUG, "Link: no device in route to %s, assuming LAN", host.c_str());
        return LinkMode::LAN;
    }

    LinkMode mode = classifyInterface(iface, sysfs_net);
    LP_LOG(INFO, "Link: route to %s via %s (%s)", host.c_str(), iface.c_str(),
           linkModeName(mode));
    return mode;
}

LinkMode resolveLinkMode(LinkMode requested, const std::string& host) {
    if (requested != LinkMode::AUTO) {
        LP_LOG(INFO, "Link: forced %s", linkModeName(requested));
        return requested;
    }
    return detectLinkMode(host);
}

} // namespace lp
