///////////////////////////////////////////////////////////////////////////////
// auth_manager.cpp -- Authentication facade implementation
///////////////////////////////////////////////////////////////////////////////

#include "auth_manager.h"
#include <lp/common.h>

#include <chrono>

namespace lp::host {

AuthManager::AuthManager(const AuthConfig& config)
    : config_(config)
    , pins_(config.pin_rotate_ms)
    , store_(config.state_dir + "/" + TrustStore::FILE_NAME)
{
}

AuthManager::~AuthManager() {
    shutdown();
}

bool AuthManager::initialize() {
    if (!ca_.ensureCa(config_.state_dir)) {
        LP_LOG(ERR, "Auth: certificate authority unavailable in %s", config_.state_dir.c_str());
        return false;
    }
    if (!store_.load()) return false;
    if (!pins_.start()) {
        LP_LOG(ERR, "Auth: could not generate initial PIN");
        return false;
    }
    return true;
}

void AuthManager::shutdown() {
    pins_.stop();
}

std::string AuthManager::generatePin() {
    if (!pins_.rotateNow()) return {};
    return pins_.current();
}

AuthError AuthManager::verifyPin(const std::string& candidate) const {
    AuthError err = pins_.verify(candidate);
    if (err != AuthError::None) {
        LP_LOG(WARN, "Auth: PIN rejected (%s)", authErrorName(err));
    }
    return err;
}

bool AuthManager::issueCertificate(const CertificateRequest& request,
                                   CertificateBundle& bundle, AuthError& error) {
    CertificateBundle issued;
    if (!signCertificate(request, issued, error)) return false;
    if (!commitCertificate(issued, request.device_name, error)) return false;
    bundle = std::move(issued);
    return true;
}

bool AuthManager::signCertificate(const CertificateRequest& request,
                                  CertificateBundle& bundle, AuthError& error) {
    error = AuthError::None;

    CertificateBundle issued;
    if (!ca_.issue(request.device_name, request.public_key_pem, issued)) {
        return false;
    }

    TrustedClient existing;
    if (store_.lookup(issued.fingerprint, existing) && !existing.revoked) {
        LP_LOG(WARN, "Auth: %s already holds a certificate", issued.fingerprint.c_str());
        error = AuthError::AlreadyIssued;
        return false;
    }

    bundle = std::move(issued);
    return true;
}

bool AuthManager::commitCertificate(const CertificateBundle& bundle,
                                    const std::string& device_name, AuthError& error) {
    TrustedClient entry;
    entry.fingerprint = bundle.fingerprint;
    entry.common_name = device_name.empty() ? "linuxplay-client" : device_name;
    entry.issued_on   = TrustStore::isoTimestampUtc();
    return store_.tryInsert(entry, error);
}

AuthError AuthManager::verifyCertificate(const std::string& cert_pem,
                                         const std::string& claimed_fingerprint) const {
    std::string actual;
    if (!ca_.verify(cert_pem, actual)) {
        LP_LOG(WARN, "Auth: certificate does not chain to host CA");
        return AuthError::UntrustedClient;
    }
    if (actual != claimed_fingerprint) {
        LP_LOG(WARN, "Auth: fingerprint mismatch (claimed %s)", claimed_fingerprint.c_str());
        return AuthError::UntrustedClient;
    }

    TrustedClient entry;
    if (!store_.lookup(actual, entry)) {
        LP_LOG(WARN, "Auth: fingerprint %s not in trust store", actual.c_str());
        return AuthError::UntrustedClient;
    }
    if (entry.revoked) {
        LP_LOG(WARN, "Auth: fingerprint %s is revoked", actual.c_str());
        return AuthError::Revoked;
    }
    return AuthError::None;
}

AuthError AuthManager::verifyPossession(const std::string& cert_pem,
                                        const std::string& fingerprint,
                                        uint64_t time_ms, const std::string& proof_hex) {
    if (proof_hex.empty()) {
        LP_LOG(WARN, "Auth: certificate login for %s carries no proof", fingerprint.c_str());
        return AuthError::UntrustedClient;
    }

    const uint64_t now_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    const uint64_t skew = time_ms > now_ms ? time_ms - now_ms : now_ms - time_ms;
    if (skew > PROOF_WINDOW_MS) {
        LP_LOG(WARN, "Auth: proof for %s is %llu ms off the host clock",
               fingerprint.c_str(), static_cast<unsigned long long>(skew));
        return AuthError::UntrustedClient;
    }

    X509Ptr cert = parseCertificatePem(cert_pem);
    if (!cert) return AuthError::UntrustedClient;
    EVP_PKEY* key = X509_get0_pubkey(cert.get());
    if (!verifyMessage(key, certificateLoginMessage(fingerprint, time_ms), proof_hex)) {
        LP_LOG(WARN, "Auth: proof signature for %s does not verify", fingerprint.c_str());
        return AuthError::UntrustedClient;
    }

    std::lock_guard<std::mutex> lock(proof_mutex_);
    auto it = last_proof_ms_.find(fingerprint);
    if (it != last_proof_ms_.end() && time_ms <= it->second) {
        LP_LOG(WARN, "Auth: replayed proof for %s", fingerprint.c_str());
        return AuthError::UntrustedClient;
    }
    last_proof_ms_[fingerprint] = time_ms;
    return AuthError::None;
}

bool AuthManager::revoke(const std::string& fingerprint) {
    return store_.revoke(fingerprint);
}

} // namespace lp::host
