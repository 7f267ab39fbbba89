///////////////////////////////////////////////////////////////////////////////
// host_config.cpp -- Defaults, JSON file and command-line parsing
///////////////////////////////////////////////////////////////////////////////

#include "host_config.h"

#include <lp/util/bitrate.h>
#include <lp/util/simple_json.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <sstream>

namespace lp::host {

namespace {

bool parseU32(const std::string& text, uint32_t& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (!end || *end != '\0' || text[0] == '-' || v > 0xFFFFFFFFull) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

bool parseBits(const std::string& text, uint64_t& out) {
    uint64_t bits = parseBitrateBits(text);
    if (bits == 0 && text != "0") return false;
    out = bits;
    return true;
}

bool isOneOf(const std::string& v, std::initializer_list<const char*> choices) {
    for (const char* c : choices) {
        if (v == c) return true;
    }
    return false;
}

} // anonymous namespace

void HostConfig::resolvePaths() {
    const char* home = std::getenv("HOME");
    const std::string base = (home && *home) ? home : ".";
    if (state_dir.empty())  state_dir  = base + "/.linuxplay";
    if (upload_dir.empty()) upload_dir = base + "/LinuxPlayDrop";
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------
bool applyConfigJson(const SimpleJson& json, HostConfig& c, std::string& error) {
    auto str = [&](const char* key, std::string& field) {
        if (json.hasKey(key)) field = json.getString(key);
    };
    auto u32 = [&](const char* key, uint32_t& field) {
        if (!json.hasKey(key)) return true;
        uint64_t v = json.getUint(key, UINT64_MAX);
        if (v > 0xFFFFFFFFull) { error = key; return false; }
        field = static_cast<uint32_t>(v);
        return true;
    };
    auto port = [&](const char* key, uint16_t& field) {
        if (!json.hasKey(key)) return true;
        uint64_t v = json.getUint(key, UINT64_MAX);
        if (v > 65535) { error = key; return false; }
        field = static_cast<uint16_t>(v);
        return true;
    };
    auto bits = [&](const char* key, uint64_t& field) {
        if (!json.hasKey(key)) return true;
        if (!parseBits(json.getString(key), field)) { error = key; return false; }
        return true;
    };

    str("bind_address", c.bind_address);
    str("display", c.display);
    str("encoder", c.encoder);
    str("hwenc", c.hwenc);
    str("audio_source", c.audio_source);
    str("preset", c.preset);
    str("qp", c.qp);
    str("pix_fmt", c.pix_fmt);
    str("state_dir", c.state_dir);
    str("upload_dir", c.upload_dir);
    str("input", c.input);

    c.audio     = json.getBool("audio", c.audio);
    c.adaptive  = json.getBool("adaptive", c.adaptive);
    c.clipboard = json.getBool("clipboard", c.clipboard);
    c.mtu       = static_cast<int>(json.getInt("mtu", c.mtu));

    if (!port("handshake_port", c.handshake_port) ||
        !port("video_base_port", c.ports.video_base) ||
        !port("audio_port", c.ports.audio) ||
        !port("control_port", c.ports.control) ||
        !port("clipboard_port", c.ports.clipboard) ||
        !port("file_port", c.ports.file) ||
        !port("heartbeat_port", c.ports.heartbeat) ||
        !port("gamepad_port", c.ports.gamepad) ||
        !u32("framerate", c.framerate) ||
        !u32("gop", c.gop) ||
        !u32("adaptive_period_secs", c.adaptive_period_secs) ||
        !u32("pin_rotate_ms", c.pin_rotate_ms) ||
        !u32("heartbeat_interval_ms", c.heartbeat_interval_ms) ||
        !u32("heartbeat_timeout_ms", c.heartbeat_timeout_ms) ||
        !u32("reconnect_cooldown_ms", c.reconnect_cooldown_ms) ||
        !u32("process_grace_ms", c.process_grace_ms) ||
        !bits("bitrate", c.bitrate_bits) ||
        !bits("adaptive_low_bitrate", c.adaptive_low_bits)) {
        return false;
    }

    if (json.hasKey("max_upload_bytes")) {
        c.max_upload_bytes = json.getUint("max_upload_bytes", c.max_upload_bytes);
    }
    if (json.hasKey("log_level") && !parseLogLevel(json.getString("log_level"), c.log_level)) {
        error = "log_level";
        return false;
    }

    if (!isOneOf(c.encoder, {"h.264", "h.265", "none"})) { error = "encoder"; return false; }
    if (!isOneOf(c.hwenc, {"auto", "cpu", "nvenc", "qsv", "vaapi"})) { error = "hwenc"; return false; }
    if (!isOneOf(c.input, {"xdotool", "none"})) { error = "input"; return false; }
    if (c.heartbeat_interval_ms == 0 || c.heartbeat_timeout_ms <= c.heartbeat_interval_ms) {
        error = "heartbeat_timeout_ms";
        return false;
    }
    return true;
}

bool loadConfigFile(const std::string& path, HostConfig& config, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    SimpleJson json;
    if (!json.parse(ss.str())) {
        error = path + " is not a JSON object";
        return false;
    }

    std::string key;
    if (!applyConfigJson(json, config, key)) {
        error = path + ": invalid value for '" + key + "'";
        return false;
    }
    LP_LOG(INFO, "Loaded configuration from %s", path.c_str());
    return true;
}

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------
void printHostUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage: %s [OPTIONS]\n"
        "\n"
        "Options:\n"
        "  --config <path>          Load settings from a JSON file\n"
        "  --encoder <codec>        h.264 | h.265 | none (default h.264)\n"
        "  --hwenc <backend>        auto | cpu | nvenc | qsv | vaapi (default auto)\n"
        "  --framerate <fps>        Capture rate (default 30)\n"
        "  --bitrate <rate>         Video bitrate, e.g. 8M, 1500k (default 8M)\n"
        "  --audio enable|disable   Stream PulseAudio output (default disable)\n"
        "  --adaptive               Toggle between high and low bitrate\n"
        "  --display <name>         X display to capture (default :0)\n"
        "  --state-dir <dir>        CA and trusted clients (default ~/.linuxplay)\n"
        "  --upload-dir <dir>       File drop target (default ~/LinuxPlayDrop)\n"
        "  --input xdotool|none     Input injection backend (default xdotool)\n"
        "  --debug                  Verbose logging\n"
        "  --list-trusted           Print the trusted client store and exit\n"
        "  --revoke <fingerprint>   Revoke a client certificate and exit\n"
        "  --help                   Show this help\n",
        argv0);
}

bool parseHostArgs(int argc, char* argv[], HostConfig& c, HostOptions& options,
                   std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = (i + 1 < argc);

        auto value = [&]() -> std::string { return argv[++i]; };

        if (arg == "--help" || arg == "-h") {
            options.command = HostCommand::Help;
            return true;
        }
        if (arg == "--debug") {
            c.log_level = LogLevel::DEBUG;
            continue;
        }
        if (arg == "--adaptive") {
            c.adaptive = true;
            continue;
        }
        if (arg == "--list-trusted") {
            options.command = HostCommand::ListTrusted;
            continue;
        }
        if (!has_value) {
            error = "missing value for " + arg;
            return false;
        }

        if (arg == "--config") {
            options.config_path = value();
            if (!loadConfigFile(options.config_path, c, error)) return false;
        } else if (arg == "--encoder") {
            c.encoder = value();
            if (!isOneOf(c.encoder, {"h.264", "h.265", "none"})) {
                error = "unknown encoder " + c.encoder;
                return false;
            }
        } else if (arg == "--hwenc") {
            c.hwenc = value();
            if (!isOneOf(c.hwenc, {"auto", "cpu", "nvenc", "qsv", "vaapi"})) {
                error = "unknown hwenc " + c.hwenc;
                return false;
            }
        } else if (arg == "--framerate") {
            std::string v = value();
            if (!parseU32(v, c.framerate) || c.framerate == 0) {
                error = "invalid framerate " + v;
                return false;
            }
        } else if (arg == "--bitrate") {
            std::string v = value();
            if (!parseBits(v, c.bitrate_bits)) {
                error = "invalid bitrate " + v;
                return false;
            }
        } else if (arg == "--audio") {
            std::string v = value();
            if (v != "enable" && v != "disable") {
                error = "--audio takes enable or disable";
                return false;
            }
            c.audio = (v == "enable");
        } else if (arg == "--display") {
            c.display = value();
        } else if (arg == "--state-dir") {
            c.state_dir = value();
        } else if (arg == "--upload-dir") {
            c.upload_dir = value();
        } else if (arg == "--input") {
            c.input = value();
            if (!isOneOf(c.input, {"xdotool", "none"})) {
                error = "unknown input backend " + c.input;
                return false;
            }
        } else if (arg == "--revoke") {
            options.command            = HostCommand::Revoke;
            options.revoke_fingerprint = value();
        } else {
            error = "unknown option " + arg;
            return false;
        }
    }
    return true;
}

} // namespace lp::host
