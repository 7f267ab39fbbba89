///////////////////////////////////////////////////////////////////////////////
// host_config.h -- linuxplay-host configuration
//
// Precedence: compiled-in defaults < JSON file (--config) < command line.
// The JSON file is a flat object whose keys match the field names below,
// e.g. {"encoder":"h.265","bitrate":"20M","heartbeat_timeout_ms":5000}.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/common.h>
#include <lp/control/ports.h>

#include <cstdint>
#include <string>

namespace lp {
class SimpleJson;
}

namespace lp::host {

struct HostConfig {
    // Network
    std::string bind_address          = "0.0.0.0";
    uint16_t    handshake_port        = DEFAULT_HANDSHAKE_PORT;
    PortMap     ports;

    // Capture / encode
    std::string display               = ":0";
    std::string encoder               = "h.264";    // h.264 | h.265 | none
    std::string hwenc                 = "auto";     // auto | cpu | nvenc | qsv | vaapi
    uint32_t    framerate             = 30;
    uint64_t    bitrate_bits          = 8'000'000;
    bool        audio                 = false;
    std::string audio_source;
    bool        adaptive              = false;
    uint64_t    adaptive_low_bits     = 0;          // 0 = half of bitrate
    uint32_t    adaptive_period_secs  = 30;
    std::string preset;
    uint32_t    gop                   = 30;
    std::string qp;
    std::string pix_fmt               = "yuv420p";
    int         mtu                   = 1500;

    // Session control
    std::string state_dir;                          // default ~/.linuxplay
    std::string upload_dir;                         // default ~/LinuxPlayDrop
    uint64_t    max_upload_bytes      = 4ULL * 1024 * 1024 * 1024;
    std::string input                 = "xdotool";  // xdotool | none
    bool        clipboard             = true;
    uint32_t    pin_rotate_ms         = 30000;
    uint32_t    heartbeat_interval_ms = 1000;
    uint32_t    heartbeat_timeout_ms  = 10000;
    uint32_t    reconnect_cooldown_ms = 0;
    uint32_t    process_grace_ms      = 1500;

    LogLevel    log_level             = LogLevel::INFO;

    /// Fill state_dir / upload_dir from $HOME when unset.
    void resolvePaths();
};

/// What main() should do after argument parsing.
enum class HostCommand {
    Run,
    Help,
    ListTrusted,
    Revoke,
};

struct HostOptions {
    HostCommand command = HostCommand::Run;
    std::string config_path;
    std::string revoke_fingerprint;
};

/// Apply every recognised key of \p json.  Returns false (and names the
/// key in \p error) on a value that does not parse.
bool applyConfigJson(const SimpleJson& json, HostConfig& config, std::string& error);

/// Read and apply a JSON config file.
bool loadConfigFile(const std::string& path, HostConfig& config, std::string& error);

/// Parse argv.  --config is loaded as soon as it is seen, so flags after
/// it override the file and flags before it are overridden by it; pass
/// --config first.
bool parseHostArgs(int argc, char* argv[], HostConfig& config, HostOptions& options,
                   std::string& error);

void printHostUsage(const char* argv0);

} // namespace lp::host
