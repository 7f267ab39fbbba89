///////////////////////////////////////////////////////////////////////////////
// file_upload.cpp -- File drop endpoint implementation
///////////////////////////////////////////////////////////////////////////////

#include "file_upload.h"

#include <lp/common.h>
#include <lp/net/tcp_util.h>

#include <algorithm>
#include <cstdio>
#include <sys/stat.h>
#include <vector>

namespace lp::host {

namespace {

constexpr uint32_t HEADER_TIMEOUT_MS = 5000;
constexpr uint32_t CHUNK_TIMEOUT_MS  = 10000;
constexpr size_t   CHUNK_SIZE        = 64 * 1024;

uint32_t readBe32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
           (uint32_t(p[2]) << 8)  |  uint32_t(p[3]);
}

uint64_t readBe64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
    return v;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// resolveUploadPath
// ---------------------------------------------------------------------------
bool resolveUploadPath(const std::string& upload_dir, const std::string& name,
                       uint64_t size, uint64_t max_bytes,
                       std::string& out_path, std::string* why) {
    auto fail = [why](const char* reason) {
        if (why) *why = reason;
        return false;
    };

    if (name.empty())                          return fail("empty name");
    if (name.size() > MAX_UPLOAD_NAME_BYTES)   return fail("name too long");
    if (name == "." || name == "..")           return fail("reserved name");
    if (name.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
        return fail("name contains a path separator or NUL");
    }
    if (size > max_bytes)                      return fail("file too large");

    std::string dir = upload_dir.empty() ? "." : upload_dir;
    if (dir.size() > 1 && dir.back() == '/') dir.pop_back();
    out_path = dir + "/" + name;
    return true;
}

// ---------------------------------------------------------------------------
// FileUploadServer
// ---------------------------------------------------------------------------
FileUploadServer::FileUploadServer(std::string upload_dir, uint64_t max_bytes)
    : upload_dir_(std::move(upload_dir))
    , max_bytes_(max_bytes)
{
}

FileUploadServer::~FileUploadServer() {
    stop();
}

bool FileUploadServer::start(const std::string& bind_address, uint16_t port,
                             const std::string& allowed_peer) {
    if (running_.load()) return false;

    listen_fd_ = openTcpListener(bind_address, port, bound_port_);
    if (listen_fd_ < 0) return false;

    allowed_peer_ = allowed_peer;
    running_.store(true);
    thread_ = std::thread(&FileUploadServer::acceptLoop, this);
    LP_LOG(DEBUG, "Upload: listening on port %u -> %s", bound_port_, upload_dir_.c_str());
    return true;
}

void FileUploadServer::stop() {
    running_.store(false);
    if (thread_.joinable()) thread_.join();
    if (listen_fd_ >= 0) {
        lp_close_socket(listen_fd_);
        listen_fd_ = -1;
    }
}

void FileUploadServer::acceptLoop() {
    while (running_.load()) {
        sockaddr_in peer{};
        int fd = acceptWithTimeout(listen_fd_, 200, peer);
        if (fd < 0) continue;

        const std::string ip = addrToString(peer);
        if (!allowed_peer_.empty() && ip != allowed_peer_) {
            LP_LOG(WARN, "Upload: dropping connection from %s (not the session client)", ip.c_str());
            lp_close_socket(fd);
            continue;
        }
        handleConnection(fd);
        lp_close_socket(fd);
    }
}

void FileUploadServer::handleConnection(int fd) {
    uint8_t len_buf[4];
    if (!readExact(fd, len_buf, sizeof(len_buf), HEADER_TIMEOUT_MS)) return;
    uint32_t name_len = readBe32(len_buf);
    if (name_len == 0 || name_len > MAX_UPLOAD_NAME_BYTES) {
        LP_LOG(WARN, "Upload: rejected name length %u", name_len);
        return;
    }

    std::string name(name_len, '\0');
    uint8_t size_buf[8];
    if (!readExact(fd, &name[0], name_len, HEADER_TIMEOUT_MS) ||
        !readExact(fd, size_buf, sizeof(size_buf), HEADER_TIMEOUT_MS)) {
        return;
    }
    const uint64_t size = readBe64(size_buf);

    std::string path, why;
    if (!resolveUploadPath(upload_dir_, name, size, max_bytes_, path, &why)) {
        LP_LOG(WARN, "Upload: rejected '%s' (%s)", name.c_str(), why.c_str());
        return;
    }

    if (::mkdir(upload_dir_.c_str(), 0755) != 0 && errno != EEXIST) {
        LP_LOG(ERR, "Upload: cannot create %s: %s", upload_dir_.c_str(), std::strerror(errno));
        return;
    }
    const std::string part = path + ".part";
    FILE* f = std::fopen(part.c_str(), "wb");
    if (!f) {
        LP_LOG(ERR, "Upload: cannot create %s: %s", part.c_str(), std::strerror(errno));
        return;
    }

    std::vector<uint8_t> chunk(CHUNK_SIZE);
    uint64_t remaining = size;
    bool ok = true;
    while (remaining > 0 && running_.load()) {
        size_t n = static_cast<size_t>(std::min<uint64_t>(remaining, chunk.size()));
        if (!readExact(fd, chunk.data(), n, CHUNK_TIMEOUT_MS) ||
            std::fwrite(chunk.data(), 1, n, f) != n) {
            ok = false;
            break;
        }
        remaining -= n;
    }
    ok = (std::fclose(f) == 0) && ok && remaining == 0;

    if (!ok || std::rename(part.c_str(), path.c_str()) != 0) {
        LP_LOG(WARN, "Upload: '%s' incomplete, discarded", name.c_str());
        std::remove(part.c_str());
        return;
    }

    files_received_.fetch_add(1);
    LP_LOG(INFO, "Upload: received %s (%llu bytes)", path.c_str(),
           static_cast<unsigned long long>(size));
}

} // namespace lp::host
