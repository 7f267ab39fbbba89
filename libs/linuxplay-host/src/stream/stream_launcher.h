///////////////////////////////////////////////////////////////////////////////
// stream_launcher.h -- Factory for the delegated media sender processes
//
// The orchestrator never builds command lines itself; it asks an
// IStreamLauncher for a running IStreamProcess per media channel.
// SubprocessLauncher runs ffmpeg; tests substitute their own launcher.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include "encoder_command.h"

#include <lp/control/ports.h>
#include <lp/util/child_process.h>

#include <cstdint>
#include <memory>
#include <string>

namespace lp::host {

// ---------------------------------------------------------------------------
// MediaLaunchRequest -- everything needed to start one media sender
// ---------------------------------------------------------------------------
struct MediaLaunchRequest {
    ChannelType     type          = ChannelType::Video;
    uint32_t        monitor_index = 0;      // Video only
    MonitorGeometry monitor;                // Video only
    MediaTarget     target;
    uint64_t        bitrate_bits  = 0;      // Video only
};

// ---------------------------------------------------------------------------
// IStreamProcess -- one running media sender
// ---------------------------------------------------------------------------
class IStreamProcess {
public:
    virtual ~IStreamProcess() = default;

    /// Non-blocking.  Returns true once the process has exited.
    virtual bool poll(int& exit_code) = 0;

    /// Ask the process to exit without waiting.
    virtual void terminate() = 0;

    /// Graceful stop with forced termination after \p grace_ms.
    virtual void stop(uint32_t grace_ms) = 0;
};

class IStreamLauncher {
public:
    virtual ~IStreamLauncher() = default;

    /// Start a sender.  Returns nullptr if it could not be launched.
    virtual std::unique_ptr<IStreamProcess> launch(const MediaLaunchRequest& request) = 0;
};

// ---------------------------------------------------------------------------
// SubprocessLauncher -- ffmpeg via ChildProcess
// ---------------------------------------------------------------------------
class SubprocessLauncher : public IStreamLauncher {
public:
    explicit SubprocessLauncher(const EncoderSettings& settings);

    std::unique_ptr<IStreamProcess> launch(const MediaLaunchRequest& request) override;

    const EncoderSettings& settings() const { return settings_; }

private:
    EncoderSettings settings_;
};

} // namespace lp::host
