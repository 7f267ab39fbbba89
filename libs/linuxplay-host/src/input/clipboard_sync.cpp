///////////////////////////////////////////////////////////////////////////////
// clipboard_sync.cpp -- Clipboard polling, echo suppression, xclip backend
///////////////////////////////////////////////////////////////////////////////

#include "clipboard_sync.h"

#include <lp/common.h>
#include <lp/control/control_message.h>
#include <lp/util/child_process.h>

#include <sys/wait.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>

namespace lp::host {

// ---------------------------------------------------------------------------
// XclipClipboard
// ---------------------------------------------------------------------------
bool XclipClipboard::get(std::string& text) {
    const std::string cmd = "DISPLAY=" + shellQuote(display_) +
                            " xclip -selection clipboard -o 2>/dev/null";
    return captureCommandOutput(cmd, text);
}

bool XclipClipboard::set(const std::string& text) {
    const std::string cmd = "DISPLAY=" + shellQuote(display_) +
                            " xclip -selection clipboard -i 2>/dev/null";
    FILE* pipe = ::popen(cmd.c_str(), "w");
    if (!pipe) {
        LP_LOG(WARN, "Clipboard: cannot run xclip: %s", std::strerror(errno));
        return false;
    }
    size_t written = std::fwrite(text.data(), 1, text.size(), pipe);
    int status = ::pclose(pipe);
    if (written != text.size() || status == -1 || !WIFEXITED(status) ||
        WEXITSTATUS(status) != 0) {
        LP_LOG(WARN, "Clipboard: xclip failed to set %zu bytes", text.size());
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// ClipboardSync
// ---------------------------------------------------------------------------
ClipboardSync::ClipboardSync(std::unique_ptr<IClipboardBackend> backend)
    : backend_(std::move(backend))
{
}

ClipboardSync::~ClipboardSync() {
    stop();
}

bool ClipboardSync::start(SendFunc send) {
    if (running_.load()) return false;

    send_ = std::move(send);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!backend_->get(last_text_)) last_text_.clear();
    }

    running_.store(true);
    thread_ = std::thread(&ClipboardSync::monitorThread, this);
    LP_LOG(INFO, "Clipboard sync started");
    return true;
}

void ClipboardSync::stop() {
    if (!running_.exchange(false)) return;
    if (thread_.joinable()) thread_.join();
    LP_LOG(INFO, "Clipboard sync stopped");
}

void ClipboardSync::monitorThread() {
    while (running_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
        if (!running_.load()) break;
        pollOnce();
    }
}

void ClipboardSync::pollOnce() {
    std::string current;
    if (!backend_->get(current)) return;

    std::string outgoing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Text the viewer just gave us reads back unchanged and is not sent.
        if (current == last_text_) return;
        last_text_ = current;
        if (current.empty() || current.size() > MAX_CLIPBOARD_BYTES) return;
        outgoing = current;
    }

    ClipboardMessage msg;
    msg.from_host = true;
    msg.text      = std::move(outgoing);
    if (send_) send_(msg.serialize());
    updates_sent_.fetch_add(1);
    LP_LOG(DEBUG, "Clipboard: sent %zu bytes to viewer", msg.text.size());
}

void ClipboardSync::onDatagram(const uint8_t* data, size_t len) {
    ClipboardMessage msg;
    if (!ClipboardMessage::parse(std::string(reinterpret_cast<const char*>(data), len), msg)) {
        LP_LOG(DEBUG, "Clipboard: dropped malformed update (%zu bytes)", len);
        return;
    }
    if (msg.from_host) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (msg.text == last_text_) return;
        last_text_ = msg.text;
    }

    if (backend_->set(msg.text)) {
        updates_applied_.fetch_add(1);
        LP_LOG(DEBUG, "Clipboard: applied %zu bytes from viewer", msg.text.size());
    }
}

} // namespace lp::host
