///////////////////////////////////////////////////////////////////////////////
// file_upload.h -- TCP file drop endpoint
//
// Wire format, one file per connection:
//   [name_len:u32 BE][name: UTF-8][size:u64 BE][data: size bytes]
//
// Only bare file names are accepted; the destination is always directly
// inside the upload directory.  Data is streamed to "<name>.part" and
// renamed into place once complete.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace lp::host {

constexpr uint32_t MAX_UPLOAD_NAME_BYTES   = 255;
constexpr uint64_t DEFAULT_MAX_UPLOAD_BYTES = 4ULL * 1024 * 1024 * 1024;

/// Validate an upload and compute its destination.  Rejects empty or
/// over-long names, names containing '/', '\\' or NUL, "." and "..", and
/// sizes above \p max_bytes.
bool resolveUploadPath(const std::string& upload_dir, const std::string& name,
                       uint64_t size, uint64_t max_bytes,
                       std::string& out_path, std::string* why = nullptr);

class FileUploadServer {
public:
    FileUploadServer(std::string upload_dir, uint64_t max_bytes);
    ~FileUploadServer();

    FileUploadServer(const FileUploadServer&) = delete;
    FileUploadServer& operator=(const FileUploadServer&) = delete;

    /// Listen and start the accept thread.  Connections from any address
    /// other than \p allowed_peer are closed immediately.
    bool start(const std::string& bind_address, uint16_t port,
               const std::string& allowed_peer);

    void stop();

    uint16_t boundPort() const { return bound_port_; }
    uint64_t filesReceived() const { return files_received_.load(); }

private:
    void acceptLoop();
    void handleConnection(int fd);

    const std::string     upload_dir_;
    const uint64_t        max_bytes_;
    std::string           allowed_peer_;

    int                   listen_fd_  = -1;
    uint16_t              bound_port_ = 0;
    std::atomic<bool>     running_{false};
    std::thread           thread_;
    std::atomic<uint64_t> files_received_{0};
};

} // namespace lp::host
