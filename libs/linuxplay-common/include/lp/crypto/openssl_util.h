///////////////////////////////////////////////////////////////////////////////
// openssl_util.h -- Shared OpenSSL plumbing
//
// RAII owners for the OpenSSL objects the mini CA handles, one-time library
// initialisation, error-queue logging, PEM/fingerprint helpers and the
// signatures a viewer uses to prove it holds its certificate key.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include <memory>
#include <string>

namespace lp {

struct X509Deleter    { void operator()(X509* p) const     { X509_free(p); } };
struct EvpPkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct BioDeleter     { void operator()(BIO* p) const      { BIO_free_all(p); } };

using X509Ptr    = std::unique_ptr<X509, X509Deleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using BioPtr     = std::unique_ptr<BIO, BioDeleter>;

void ensureOpenSslInit();

/// Drain the OpenSSL error queue into the log.
void logSslErrors(const char* context);

/// EC P-256 key pair.
EvpPkeyPtr generateEcKey();

X509Ptr     parseCertificatePem(const std::string& pem);
EvpPkeyPtr  parsePublicKeyPem(const std::string& pem);
EvpPkeyPtr  parsePrivateKeyPem(const std::string& pem);
std::string certificateToPem(X509* cert);
std::string privateKeyToPem(EVP_PKEY* key);

/// SHA-256 of the DER SubjectPublicKeyInfo as colon-separated uppercase hex.
std::string publicKeyFingerprint(EVP_PKEY* key);

/// SHA-256 signature of \p message as lowercase hex.
bool signMessage(EVP_PKEY* key, const std::string& message, std::string& signature_hex);

/// Check a signMessage() result against the public half of \p key.
bool verifyMessage(EVP_PKEY* key, const std::string& message,
                   const std::string& signature_hex);

} // namespace lp
