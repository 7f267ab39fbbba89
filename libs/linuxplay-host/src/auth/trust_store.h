///////////////////////////////////////////////////////////////////////////////
// trust_store.h -- Persistent registry of certificate-holding clients
//
// Backed by trusted_clients.json in the host state directory:
//
//   {"trusted_clients":[{"fingerprint":"AB:CD:...","common_name":"laptop",
//                        "issued_on":"2024-01-01T00:00:00Z",
//                        "status":"trusted"}]}
//
// Every mutation rewrites the file through a temp file + fsync + rename so
// a crash never leaves a truncated database behind.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/control/errors.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace lp::host {

struct TrustedClient {
    std::string fingerprint;
    std::string common_name;
    std::string issued_on;      // ISO-8601 UTC
    bool        revoked = false;
};

class TrustStore {
public:
    static constexpr const char* FILE_NAME = "trusted_clients.json";

    explicit TrustStore(std::string path);

    TrustStore(const TrustStore&) = delete;
    TrustStore& operator=(const TrustStore&) = delete;

    /// Load the database.  A missing file is an empty store; a corrupt one
    /// is an error.
    bool load();

    /// Atomic check-and-set.  Fails with AlreadyIssued if a non-revoked
    /// entry with the same fingerprint exists; a revoked entry is replaced.
    /// On a storage failure returns false with \p error left at None.
    bool tryInsert(const TrustedClient& entry, AuthError& error);

    bool lookup(const std::string& fingerprint, TrustedClient& out) const;

    /// Mark an entry revoked.  Returns false for an unknown fingerprint.
    bool revoke(const std::string& fingerprint);

    std::vector<TrustedClient> list() const;

    const std::string& path() const { return path_; }

    /// Current time as "YYYY-MM-DDTHH:MM:SSZ".
    static std::string isoTimestampUtc();

private:
    bool saveLocked() const;

    const std::string                    path_;
    mutable std::mutex                   mutex_;
    std::map<std::string, TrustedClient> entries_;
};

} // namespace lp::host
