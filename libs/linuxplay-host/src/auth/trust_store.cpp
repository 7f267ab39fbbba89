///////////////////////////////////////////////////////////////////////////////
// trust_store.cpp -- trusted_clients.json persistence
///////////////////////////////////////////////////////////////////////////////

#include "trust_store.h"
#include <lp/common.h>
#include <lp/util/simple_json.h>

#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace lp::host {

namespace {

bool writeAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

} // anonymous namespace

TrustStore::TrustStore(std::string path)
    : path_(std::move(path))
{
}

std::string TrustStore::isoTimestampUtc() {
    std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
    ::gmtime_r(&now, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

// ---------------------------------------------------------------------------
// load
// ---------------------------------------------------------------------------
bool TrustStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();

    std::ifstream in(path_);
    if (!in) {
        LP_LOG(DEBUG, "TrustStore: %s not present, starting empty", path_.c_str());
        return true;
    }
    std::stringstream ss;
    ss << in.rdbuf();

    SimpleJson root;
    if (!root.parse(ss.str())) {
        LP_LOG(ERR, "TrustStore: %s is not valid JSON", path_.c_str());
        return false;
    }

    std::vector<std::string> records;
    if (root.hasKey("trusted_clients") &&
        !SimpleJson::splitObjectArray(root.getString("trusted_clients"), records)) {
        LP_LOG(ERR, "TrustStore: malformed trusted_clients array in %s", path_.c_str());
        return false;
    }

    for (const auto& text : records) {
        SimpleJson rec;
        if (!rec.parse(text)) {
            LP_LOG(WARN, "TrustStore: skipping unreadable record");
            continue;
        }
        TrustedClient c;
        c.fingerprint = rec.getString("fingerprint");
        c.common_name = rec.getString("common_name");
        c.issued_on   = rec.getString("issued_on");
        c.revoked     = (rec.getString("status") == "revoked");
        if (c.fingerprint.empty()) continue;
        entries_[c.fingerprint] = c;
    }

    LP_LOG(INFO, "TrustStore: loaded %zu client(s) from %s", entries_.size(), path_.c_str());
    return true;
}

// ---------------------------------------------------------------------------
// saveLocked -- temp file, fsync, rename
// ---------------------------------------------------------------------------
bool TrustStore::saveLocked() const {
    std::string array = "[";
    bool first = true;
    for (const auto& [fp, c] : entries_) {
        SimpleJson rec;
        rec.setString("fingerprint", c.fingerprint);
        rec.setString("common_name", c.common_name);
        rec.setString("issued_on", c.issued_on);
        rec.setString("status", c.revoked ? "revoked" : "trusted");
        if (!first) array += ",";
        array += rec.serialize();
        first = false;
    }
    array += "]";

    SimpleJson root;
    root.setRaw("trusted_clients", array);
    const std::string body = root.serialize() + "\n";

    const std::string tmp = path_ + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        LP_LOG(ERR, "TrustStore: cannot create %s: %s", tmp.c_str(), std::strerror(errno));
        return false;
    }
    bool ok = writeAll(fd, body) && ::fsync(fd) == 0;
    ::close(fd);

    if (!ok || ::rename(tmp.c_str(), path_.c_str()) != 0) {
        LP_LOG(ERR, "TrustStore: failed to write %s: %s", path_.c_str(), std::strerror(errno));
        ::unlink(tmp.c_str());
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------
bool TrustStore::tryInsert(const TrustedClient& entry, AuthError& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    error = AuthError::None;

    TrustedClient previous;
    bool had_previous = false;
    auto it = entries_.find(entry.fingerprint);
    if (it != entries_.end()) {
        if (!it->second.revoked) {
            LP_LOG(WARN, "TrustStore: %s already issued", entry.fingerprint.c_str());
            error = AuthError::AlreadyIssued;
            return false;
        }
        previous     = it->second;
        had_previous = true;
    }

    TrustedClient stored = entry;
    stored.revoked = false;
    entries_[stored.fingerprint] = stored;

    if (!saveLocked()) {
        if (had_previous) entries_[entry.fingerprint] = previous;
        else              entries_.erase(entry.fingerprint);
        return false;
    }

    LP_LOG(INFO, "TrustStore: trusted %s (%s)",
           stored.fingerprint.c_str(), stored.common_name.c_str());
    return true;
}

bool TrustStore::lookup(const std::string& fingerprint, TrustedClient& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(fingerprint);
    if (it == entries_.end()) return false;
    out = it->second;
    return true;
}

bool TrustStore::revoke(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(fingerprint);
    if (it == entries_.end()) {
        LP_LOG(WARN, "TrustStore: revoke of unknown fingerprint %s", fingerprint.c_str());
        return false;
    }
    if (it->second.revoked) return true;

    it->second.revoked = true;
    if (!saveLocked()) {
        it->second.revoked = false;
        return false;
    }
    LP_LOG(INFO, "TrustStore: revoked %s", fingerprint.c_str());
    return true;
}

std::vector<TrustedClient> TrustStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TrustedClient> out;
    out.reserve(entries_.size());
    for (const auto& [fp, c] : entries_) out.push_back(c);
    return out;
}

} // namespace lp::host
