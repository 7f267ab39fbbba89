///////////////////////////////////////////////////////////////////////////////
// viewer_options.cpp -- Command line for linuxplay-viewer
///////////////////////////////////////////////////////////////////////////////

#include "viewer_options.h"

#include <cstdio>
#include <cstdlib>

namespace lp {

std::string defaultCertDir() {
    const char* home = std::getenv("HOME");
    return std::string(home && *home ? home : ".") + "/.linuxplay-viewer";
}

bool parseMonitorIndices(const std::string& text, std::vector<uint32_t>& out) {
    std::vector<uint32_t> result;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        const std::string item = text.substr(start, comma - start);
        if (item.empty() || item.size() > 4 ||
            item.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        result.push_back(static_cast<uint32_t>(std::stoul(item)));
        start = comma + 1;
    }
    out = std::move(result);
    return true;
}

void printViewerUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage: %s --host <address> [OPTIONS]\n"
        "\n"
        "Options:\n"
        "  --host <address>         Host to connect to (required)\n"
        "  --port <port>            Handshake port (default 7001)\n"
        "  --pin <digits>           Session PIN shown by the host\n"
        "  --cert-dir <dir>         Client certificate store (default ~/.linuxplay-viewer)\n"
        "  --net auto|lan|wifi      Link classification (default auto)\n"
        "  --monitor <list>         Monitor indices, e.g. 0,1 (default all)\n"
        "  --request-cert           Ask for a client certificate on PIN login\n"
        "  --device <name>          Name recorded with the certificate\n"
        "  --decoder <program>      Decoder program (default ffplay)\n"
        "  --audio                  Play the host audio stream\n"
        "  --debug                  Verbose logging\n"
        "  --help                   Show this help\n",
        argv0);
}

bool parseViewerArgs(int argc, char* argv[], ViewerConfig& c, ViewerOptions& options,
                     std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = (i + 1 < argc);

        auto value = [&]() -> std::string { return argv[++i]; };

        if (arg == "--help" || arg == "-h") {
            options.help = true;
            return true;
        }
        if (arg == "--debug") {
            options.log_level = LogLevel::DEBUG;
            continue;
        }
        if (arg == "--request-cert") {
            c.request_cert = true;
            continue;
        }
        if (arg == "--audio") {
            c.audio = true;
            continue;
        }
        if (!has_value) {
            error = "missing value for " + arg;
            return false;
        }

        if (arg == "--host") {
            c.host = value();
        } else if (arg == "--port") {
            std::string v = value();
            char* end = nullptr;
            unsigned long p = std::strtoul(v.c_str(), &end, 10);
            if (v.empty() || *end != '\0' || p == 0 || p > 65535) {
                error = "invalid port " + v;
                return false;
            }
            c.handshake_port = static_cast<uint16_t>(p);
        } else if (arg == "--pin") {
            c.pin = value();
        } else if (arg == "--cert-dir") {
            c.cert_dir = value();
        } else if (arg == "--net") {
            std::string v = value();
            if (!parseLinkMode(v, c.link_mode)) {
                error = "--net takes auto, lan or wifi";
                return false;
            }
        } else if (arg == "--monitor") {
            std::string v = value();
            if (!parseMonitorIndices(v, c.monitors)) {
                error = "invalid monitor list " + v;
                return false;
            }
        } else if (arg == "--device") {
            c.device_name = value();
        } else if (arg == "--decoder") {
            c.decoder = value();
        } else {
            error = "unknown option " + arg;
            return false;
        }
    }

    if (c.host.empty()) {
        error = "--host is required";
        return false;
    }
    if (c.cert_dir.empty()) c.cert_dir = defaultCertDir();
    return true;
}

} // namespace lp
