///////////////////////////////////////////////////////////////////////////////
// encoder_command.cpp -- ffmpeg argv builders
///////////////////////////////////////////////////////////////////////////////

#include "encoder_command.h"

#include <lp/common.h>
#include <lp/util/bitrate.h>
#include <lp/util/child_process.h>

#include <algorithm>
#include <cctype>
#include <sys/stat.h>

namespace lp::host {

namespace {

std::string lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool pathExists(const char* path) {
    struct stat st;
    return ::stat(path, &st) == 0;
}

bool ffmpegHasEncoder(const std::string& name) {
    std::string out;
    if (!captureCommandOutput("ffmpeg -hide_banner -encoders 2>/dev/null", out)) return false;
    return out.find(" " + name + " ") != std::string::npos;
}

/// Low-latency demuxer flags shared by both inputs.
void appendInputFlags(std::vector<std::string>& cmd) {
    for (const char* a : {"-fflags", "nobuffer", "-avioflags", "direct",
                          "-use_wallclock_as_timestamps", "1",
                          "-thread_queue_size", "64",
                          "-probesize", "32", "-analyzeduration", "0"}) {
        cmd.emplace_back(a);
    }
}

void appendMuxFlags(std::vector<std::string>& cmd, const std::string& session_id) {
    for (const char* a : {"-flush_packets", "1", "-max_interleave_delta", "0",
                          "-muxdelay", "0", "-muxpreload", "0",
                          "-mpegts_flags", "resend_headers"}) {
        cmd.emplace_back(a);
    }
    cmd.emplace_back("-metadata");
    cmd.emplace_back("comment=" + processMarker(session_id));
}

} // anonymous namespace

std::string processMarker(const std::string& session_id) {
    return "LinuxPlayHost:" + session_id;
}

std::string buildVideoUrl(const MediaTarget& target, uint32_t pkt_size) {
    return "udp://" + target.client_ip + ":" + std::to_string(target.port) +
           "?pkt_size=" + std::to_string(pkt_size) +
           "&buffer_size=" + std::to_string(target.buffers.video_buffer_bytes) +
           "&fifo_size=" + std::to_string(target.buffers.video_fifo_packets) +
           "&overrun_nonfatal=1" +
           "&max_delay=" + std::to_string(target.buffers.video_max_delay_us);
}

std::string buildAudioUrl(const MediaTarget& target, uint32_t pkt_size) {
    return "udp://" + target.client_ip + ":" + std::to_string(target.port) +
           "?pkt_size=" + std::to_string(pkt_size) +
           "&buffer_size=" + std::to_string(target.buffers.audio_buffer_bytes) +
           "&overrun_nonfatal=1" +
           "&max_delay=" + std::to_string(target.buffers.audio_max_delay_us);
}

// ---------------------------------------------------------------------------
// resolveHwEncoder
// ---------------------------------------------------------------------------
std::string resolveHwEncoder(const std::string& codec, const std::string& hwenc) {
    const std::string h = lower(hwenc);
    if (h != "auto") return h.empty() ? "cpu" : h;

    const std::string c = lower(codec);
    if (c != "h.264" && c != "h.265") return "cpu";
    const std::string family = (c == "h.264") ? "h264" : "hevc";

    if (pathExists("/proc/driver/nvidia/version") && ffmpegHasEncoder(family + "_nvenc")) {
        return "nvenc";
    }
    if (pathExists("/dev/dri/renderD128")) {
        if (ffmpegHasEncoder(family + "_qsv"))   return "qsv";
        if (ffmpegHasEncoder(family + "_vaapi")) return "vaapi";
    }
    return "cpu";
}

// ---------------------------------------------------------------------------
// encoderArgs
// ---------------------------------------------------------------------------
std::vector<std::string> encoderArgs(const EncoderSettings& s, uint64_t bitrate_bits) {
    const std::string codec = lower(s.codec);
    if (codec != "h.264" && codec != "h.265") return {};

    const bool   hevc  = (codec == "h.265");
    const std::string hw = lower(s.hwenc);
    const std::string rate = formatBits(bitrate_bits);
    const std::string qp   = s.qp.empty() ? "23" : s.qp;

    std::vector<std::string> rc;
    if (bitrate_bits == 0) {
        if (hw == "vaapi")      rc = {"-rc_mode", "CQP", "-qp", s.qp.empty() ? "21" : s.qp};
        else if (hw == "nvenc") rc = {"-rc", "constqp", "-qp", qp};
        else if (hw == "qsv")   rc = {"-rc_mode", "ICQ", "-icq_quality", qp};
        else                    rc = {"-crf", qp};
    } else if (s.adaptive) {
        if (hw == "nvenc")      rc = {"-rc", "vbr", "-maxrate", rate, "-cq", qp};
        else if (hw == "vaapi") rc = {"-rc_mode", "CQP", "-qp", s.qp.empty() ? "21" : s.qp};
        else if (hw == "qsv")   rc = {"-rc_mode", "ICQ", "-icq_quality", qp};
        else                    rc = {"-crf", qp};
    } else {
        rc = {"-b:v", rate};
    }

    std::vector<std::string> gop;
    if (s.gop > 0) gop = {"-g", std::to_string(s.gop)};

    const std::string annexb = hevc ? "hevc_mp4toannexb" : "h264_mp4toannexb";
    std::vector<std::string> args;
    auto add = [&args](const std::vector<std::string>& v) {
        args.insert(args.end(), v.begin(), v.end());
    };

    if (hw == "nvenc") {
        add({"-c:v", hevc ? "hevc_nvenc" : "h264_nvenc",
             "-preset", s.preset.empty() ? (hevc ? "p5" : "llhq") : s.preset});
        add(gop);
        add({"-bf", "0", "-rc-lookahead", "0", "-refs", "1", "-flags2", "+fast"});
        add(rc);
        add({"-pix_fmt", s.pix_fmt, "-tune", "ll"});
    } else if (hw == "qsv") {
        add({"-c:v", hevc ? "hevc_qsv" : "h264_qsv"});
        add(rc);
        add({"-pix_fmt", s.pix_fmt});
    } else if (hw == "vaapi") {
        add({"-vaapi_device", "/dev/dri/renderD128", "-vf", "format=nv12,hwupload",
             "-c:v", hevc ? "hevc_vaapi" : "h264_vaapi", "-bf", "0"});
        add(rc);
    } else {
        add({"-c:v", hevc ? "libx265" : "libx264",
             "-preset", s.preset.empty() ? "ultrafast" : s.preset,
             "-tune", "zerolatency"});
        add(gop);
        add(rc);
        add({"-pix_fmt", s.pix_fmt});
    }
    add({"-bsf:v", annexb});
    return args;
}

// ---------------------------------------------------------------------------
// buildVideoCommand
// ---------------------------------------------------------------------------
std::vector<std::string> buildVideoCommand(const EncoderSettings& settings,
                                           const MonitorGeometry& monitor,
                                           const MediaTarget& target,
                                           uint64_t bitrate_bits) {
    const uint32_t fps = std::max<uint32_t>(1, settings.framerate);
    const std::string codec_for_bpp =
        lower(settings.codec) == "none" ? "h.264" : settings.codec;

    uint64_t bits = bitrate_bits;
    const uint64_t floor_bits =
        minimumSafeBitrate(codec_for_bpp, monitor.width, monitor.height, fps);
    if (bits != 0 && bits < floor_bits) {
        LP_LOG(WARN, "Encoder: bitrate too low for %ux%u@%ufps (%s < %s), bumping",
               monitor.width, monitor.height, fps,
               formatBits(bits).c_str(), formatBits(floor_bits).c_str());
        bits = floor_bits;
    }

    std::string display = settings.display.empty() ? ":0" : settings.display;
    if (display.find('.') == std::string::npos) display += ".0";

    std::vector<std::string> cmd = {settings.program, "-hide_banner", "-loglevel", "error"};
    appendInputFlags(cmd);
    for (const std::string& a : {std::string("-f"), std::string("x11grab"),
                                 std::string("-draw_mouse"), std::string("0"),
                                 std::string("-framerate"), std::to_string(fps),
                                 std::string("-video_size"),
                                 std::to_string(monitor.width) + "x" + std::to_string(monitor.height),
                                 std::string("-i"),
                                 display + "+" + std::to_string(monitor.x) + "," +
                                     std::to_string(monitor.y),
                                 std::string("-fps_mode"), std::string("passthrough")}) {
        cmd.push_back(a);
    }

    auto enc = encoderArgs(settings, bits);
    cmd.insert(cmd.end(), enc.begin(), enc.end());

    appendMuxFlags(cmd, target.session_id);
    cmd.emplace_back("-flags");
    cmd.emplace_back("+low_delay");
    cmd.emplace_back("-f");
    cmd.emplace_back("mpegts");
    cmd.push_back(buildVideoUrl(target, bestTsPacketSize(settings.mtu, false)));
    return cmd;
}

std::vector<std::string> buildAudioCommand(const EncoderSettings& settings,
                                           const MediaTarget& target) {
    std::string source = settings.audio_source.empty() ? "default.monitor"
                                                       : settings.audio_source;
    if (source.size() < 8 || source.compare(source.size() - 8, 8, ".monitor") != 0) {
        source += ".monitor";
    }

    std::vector<std::string> cmd = {settings.program, "-hide_banner", "-loglevel", "error"};
    appendInputFlags(cmd);
    for (const char* a : {"-f", "pulse", "-i"}) cmd.emplace_back(a);
    cmd.push_back(source);
    for (const char* a : {"-fps_mode", "passthrough",
                          "-c:a", "libopus", "-b:a", "128k",
                          "-application", "voip", "-frame_duration", "10"}) {
        cmd.emplace_back(a);
    }
    appendMuxFlags(cmd, target.session_id);
    cmd.emplace_back("-f");
    cmd.emplace_back("mpegts");
    cmd.push_back(buildAudioUrl(target, bestTsPacketSize(settings.mtu, false)));
    return cmd;
}

} // namespace lp::host
