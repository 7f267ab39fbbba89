///////////////////////////////////////////////////////////////////////////////
// clipboard_sync.h -- Host clipboard <-> viewer clipboard
//
// Text only, at most 64 KiB.  The host clipboard is polled every 200 ms;
// a change is sent to the viewer as "CLIPBOARD_UPDATE HOST <text>".
// Updates from the viewer are applied to the host clipboard and remembered,
// so the next poll does not bounce the same text straight back.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace lp::host {

class IClipboardBackend {
public:
    virtual ~IClipboardBackend() = default;

    /// Current clipboard text.  Returns false if it could not be read.
    virtual bool get(std::string& text) = 0;
    virtual bool set(const std::string& text) = 0;
};

/// X11 CLIPBOARD selection through the xclip utility.
class XclipClipboard : public IClipboardBackend {
public:
    explicit XclipClipboard(std::string display) : display_(std::move(display)) {}

    bool get(std::string& text) override;
    bool set(const std::string& text) override;

private:
    std::string display_;
};

class ClipboardSync {
public:
    static constexpr uint32_t POLL_INTERVAL_MS = 200;

    using SendFunc = std::function<void(const std::string& datagram)>;

    explicit ClipboardSync(std::unique_ptr<IClipboardBackend> backend);
    ~ClipboardSync();

    ClipboardSync(const ClipboardSync&) = delete;
    ClipboardSync& operator=(const ClipboardSync&) = delete;

    /// Snapshot the current clipboard and start polling it.
    bool start(SendFunc send);
    void stop();

    /// A datagram from the clipboard channel.
    void onDatagram(const uint8_t* data, size_t len);

    /// One poll step; the monitor thread calls this every POLL_INTERVAL_MS.
    void pollOnce();

    uint64_t updatesSent() const { return updates_sent_.load(); }
    uint64_t updatesApplied() const { return updates_applied_.load(); }

private:
    void monitorThread();

    std::unique_ptr<IClipboardBackend> backend_;
    SendFunc                send_;
    std::thread             thread_;
    std::atomic<bool>       running_{false};

    std::mutex              mutex_;
    std::string             last_text_;

    std::atomic<uint64_t>   updates_sent_{0};
    std::atomic<uint64_t>   updates_applied_{0};
};

} // namespace lp::host
