///////////////////////////////////////////////////////////////////////////////
// auth_manager.h -- Host authentication facade
//
// Combines the rotating PIN, the mini CA and the trusted-client store
// behind the operations the admission controller needs.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include "certificate_authority.h"
#include "pin_manager.h"
#include "trust_store.h"

#include <lp/control/errors.h>
#include <lp/control/handshake.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lp::host {

struct AuthConfig {
    std::string state_dir          = ".";
    uint32_t    pin_rotate_ms      = PinManager::DEFAULT_ROTATE_INTERVAL;
};

/// Trust-upgrade request carried by a PIN handshake.
struct CertificateRequest {
    std::string device_name;
    std::string public_key_pem;     // empty: host generates the key pair
};

class AuthManager {
public:
    static constexpr uint64_t PROOF_WINDOW_MS = 60'000;

    explicit AuthManager(const AuthConfig& config);
    ~AuthManager();

    AuthManager(const AuthManager&) = delete;
    AuthManager& operator=(const AuthManager&) = delete;

    /// Create or load the CA, load the trust store and start PIN rotation.
    bool initialize();

    /// Stop PIN rotation.
    void shutdown();

    /// Force a fresh PIN now.  Returns the new value (empty on failure).
    std::string generatePin();

    AuthError verifyPin(const std::string& candidate) const;

    /// Sign a client certificate and record it as trusted.  Must only be
    /// called right after verifyPin() succeeded.  Returns false with
    /// \p error = AlreadyIssued if the fingerprint is already trusted, or
    /// with \p error = None on an internal failure.
    bool issueCertificate(const CertificateRequest& request, CertificateBundle& bundle,
                          AuthError& error);

    /// First half of issueCertificate(): sign, but record nothing.  Fails
    /// early with AlreadyIssued when the key is already trusted.
    bool signCertificate(const CertificateRequest& request, CertificateBundle& bundle,
                         AuthError& error);

    /// Second half: record a bundle from signCertificate() as trusted.  The
    /// check-and-set runs here, so a concurrent commit of the same key
    /// fails with AlreadyIssued.
    bool commitCertificate(const CertificateBundle& bundle, const std::string& device_name,
                           AuthError& error);

    /// Validate a certificate login.  Returns None when the certificate
    /// chains to the host CA, is in date, matches \p claimed_fingerprint and
    /// is trusted.
    AuthError verifyCertificate(const std::string& cert_pem,
                                const std::string& claimed_fingerprint) const;

    /// Proof that the caller of a certificate login holds the certificate's
    /// private key: \p proof_hex signs certificateLoginMessage(fingerprint,
    /// time_ms).  The time must lie within PROOF_WINDOW_MS of the host clock
    /// and be newer than the last proof accepted for that fingerprint, so a
    /// captured handshake cannot be replayed.  Returns None or UntrustedClient.
    AuthError verifyPossession(const std::string& cert_pem, const std::string& fingerprint,
                               uint64_t time_ms, const std::string& proof_hex);

    bool revoke(const std::string& fingerprint);

    std::vector<TrustedClient> trustedClients() const { return store_.list(); }

    PinManager&           pins()      { return pins_; }
    CertificateAuthority& authority() { return ca_; }

private:
    AuthConfig           config_;
    PinManager           pins_;
    CertificateAuthority ca_;
    TrustStore           store_;

    std::mutex                      proof_mutex_;
    std::map<std::string, uint64_t> last_proof_ms_;     // fingerprint -> time_ms
};

} // namespace lp::host
