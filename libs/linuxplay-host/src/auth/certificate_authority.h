///////////////////////////////////////////////////////////////////////////////
// certificate_authority.h -- Host-local mini CA
//
// Owns the host CA key pair (host_ca.pem / host_ca.key in the state
// directory) and signs client certificates after a PIN login asked for a
// trust upgrade.  Client identity is the SHA-256 fingerprint of the
// certificate's public key, so a re-issued certificate for the same key
// keeps the same identity.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/crypto/openssl_util.h>

#include <lp/control/handshake.h>

#include <string>

namespace lp::host {

class CertificateAuthority {
public:
    static constexpr const char* CA_CERT_FILE = "host_ca.pem";
    static constexpr const char* CA_KEY_FILE  = "host_ca.key";

    static constexpr long CA_VALIDITY_DAYS     = 3650;
    static constexpr long CLIENT_VALIDITY_DAYS = 825;

    CertificateAuthority() = default;

    CertificateAuthority(const CertificateAuthority&) = delete;
    CertificateAuthority& operator=(const CertificateAuthority&) = delete;

    /// Load the CA from \p state_dir, creating it if either file is missing.
    bool ensureCa(const std::string& state_dir);

    bool loaded() const { return cert_ && key_; }

    const std::string& caCertPem() const { return ca_pem_; }

    /// Sign a client certificate for \p common_name.  With an empty
    /// \p public_key_pem a fresh EC P-256 key is generated and returned in
    /// the bundle; otherwise the supplied key is certified and
    /// bundle.client_key_pem stays empty.
    bool issue(const std::string& common_name, const std::string& public_key_pem,
               CertificateBundle& bundle);

    /// Check that \p cert_pem was signed by this CA and is inside its
    /// validity window.  On success \p fingerprint receives the public key
    /// fingerprint.
    bool verify(const std::string& cert_pem, std::string& fingerprint) const;

private:
    bool createCa(const std::string& cert_path, const std::string& key_path);
    bool loadCa(const std::string& cert_path, const std::string& key_path);

    X509Ptr     cert_;
    EvpPkeyPtr  key_;
    std::string ca_pem_;
};

} // namespace lp::host
