///////////////////////////////////////////////////////////////////////////////
// stream_launcher.cpp -- ffmpeg subprocess launcher
///////////////////////////////////////////////////////////////////////////////

#include "stream_launcher.h"

#include <lp/common.h>

namespace lp::host {

namespace {

class SubprocessStream : public IStreamProcess {
public:
    bool start(const std::vector<std::string>& argv) { return child_.start(argv); }

    bool poll(int& exit_code) override { return child_.poll(exit_code); }
    void terminate() override { child_.terminate(); }
    void stop(uint32_t grace_ms) override { child_.stop(grace_ms); }

private:
    ChildProcess child_;
};

} // anonymous namespace

SubprocessLauncher::SubprocessLauncher(const EncoderSettings& settings)
    : settings_(settings)
{
    settings_.hwenc = resolveHwEncoder(settings_.codec, settings_.hwenc);
    LP_LOG(INFO, "Encoder: codec=%s backend=%s fps=%u display=%s",
           settings_.codec.c_str(), settings_.hwenc.c_str(),
           settings_.framerate, settings_.display.c_str());
}

std::unique_ptr<IStreamProcess> SubprocessLauncher::launch(const MediaLaunchRequest& request) {
    std::vector<std::string> argv;
    if (request.type == ChannelType::Video) {
        argv = buildVideoCommand(settings_, request.monitor, request.target, request.bitrate_bits);
    } else if (request.type == ChannelType::Audio) {
        argv = buildAudioCommand(settings_, request.target);
    } else {
        LP_LOG(ERR, "Launcher: %s is not a media channel", channelTypeName(request.type));
        return nullptr;
    }

    std::string joined;
    for (const auto& a : argv) joined += (joined.empty() ? "" : " ") + a;
    LP_LOG(DEBUG, "Launcher: %s", joined.c_str());

    auto proc = std::make_unique<SubprocessStream>();
    if (!proc->start(argv)) return nullptr;
    return proc;
}

} // namespace lp::host
