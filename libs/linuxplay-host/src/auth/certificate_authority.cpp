///////////////////////////////////////////////////////////////////////////////
// certificate_authority.cpp -- Mini CA implementation (OpenSSL 3)
///////////////////////////////////////////////////////////////////////////////

#include "certificate_authority.h"
#include <lp/common.h>

#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>

namespace lp::host {

namespace {

bool fileExists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

bool randomSerial(X509* x) {
    BIGNUM* bn = BN_new();
    if (!bn) return false;
    bool ok = BN_rand(bn, 64, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) == 1 &&
              BN_to_ASN1_INTEGER(bn, X509_get_serialNumber(x)) != nullptr;
    BN_free(bn);
    return ok;
}

bool addExtension(X509* subject, X509* issuer, int nid, const char* value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, subject, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
    if (!ext) return false;
    int ok = X509_add_ext(subject, ext, -1);
    X509_EXTENSION_free(ext);
    return ok == 1;
}

bool setCommonName(X509_NAME* name, const std::string& cn) {
    return X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
                                      reinterpret_cast<const unsigned char*>(cn.c_str()),
                                      -1, -1, 0) == 1;
}

bool writeFile(const std::string& path, const std::string& data, mode_t mode) {
    FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) {
        LP_LOG(ERR, "CA: cannot write %s: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    ::chmod(path.c_str(), mode);
    bool ok = std::fwrite(data.data(), 1, data.size(), f) == data.size();
    ok = (std::fclose(f) == 0) && ok;
    if (!ok) LP_LOG(ERR, "CA: short write to %s", path.c_str());
    return ok;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ensureCa
// ---------------------------------------------------------------------------
bool CertificateAuthority::ensureCa(const std::string& state_dir) {
    ensureOpenSslInit();

    if (::mkdir(state_dir.c_str(), 0700) != 0 && errno != EEXIST) {
        LP_LOG(ERR, "CA: cannot create %s: %s", state_dir.c_str(), std::strerror(errno));
        return false;
    }

    const std::string cert_path = state_dir + "/" + CA_CERT_FILE;
    const std::string key_path  = state_dir + "/" + CA_KEY_FILE;

    if (fileExists(cert_path) && fileExists(key_path)) {
        return loadCa(cert_path, key_path);
    }
    return createCa(cert_path, key_path);
}

bool CertificateAuthority::loadCa(const std::string& cert_path, const std::string& key_path) {
    FILE* cf = std::fopen(cert_path.c_str(), "rb");
    FILE* kf = std::fopen(key_path.c_str(), "rb");
    X509*     cert = cf ? PEM_read_X509(cf, nullptr, nullptr, nullptr) : nullptr;
    EVP_PKEY* key  = kf ? PEM_read_PrivateKey(kf, nullptr, nullptr, nullptr) : nullptr;
    if (cf) std::fclose(cf);
    if (kf) std::fclose(kf);

    cert_.reset(cert);
    key_.reset(key);
    if (!cert_ || !key_) {
        logSslErrors("loadCa");
        LP_LOG(ERR, "CA: could not load %s / %s", cert_path.c_str(), key_path.c_str());
        cert_.reset();
        key_.reset();
        return false;
    }
    if (X509_check_private_key(cert_.get(), key_.get()) != 1) {
        logSslErrors("X509_check_private_key");
        LP_LOG(ERR, "CA: %s does not match %s", key_path.c_str(), cert_path.c_str());
        cert_.reset();
        key_.reset();
        return false;
    }

    ca_pem_ = certificateToPem(cert_.get());
    LP_LOG(INFO, "CA: loaded existing authority from %s", cert_path.c_str());
    return true;
}

bool CertificateAuthority::createCa(const std::string& cert_path, const std::string& key_path) {
    EvpPkeyPtr key = generateEcKey();
    if (!key) return false;

    X509Ptr x(X509_new());
    if (!x) { logSslErrors("X509_new"); return false; }

    X509_set_version(x.get(), 2);
    bool ok = randomSerial(x.get());

    X509_gmtime_adj(X509_getm_notBefore(x.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(x.get()), 86400L * CA_VALIDITY_DAYS);
    X509_set_pubkey(x.get(), key.get());

    X509_NAME* name = X509_get_subject_name(x.get());
    ok = ok && setCommonName(name, "LinuxPlay Host CA");
    ok = ok && X509_set_issuer_name(x.get(), name) == 1;  // self-signed
    ok = ok && addExtension(x.get(), x.get(), NID_basic_constraints, "critical,CA:TRUE");
    ok = ok && addExtension(x.get(), x.get(), NID_key_usage, "critical,keyCertSign,cRLSign");
    ok = ok && addExtension(x.get(), x.get(), NID_subject_key_identifier, "hash");

    if (!ok || X509_sign(x.get(), key.get(), EVP_sha256()) == 0) {
        logSslErrors("createCa");
        return false;
    }

    const std::string cert_pem = certificateToPem(x.get());
    const std::string key_pem  = privateKeyToPem(key.get());
    if (cert_pem.empty() || key_pem.empty()) return false;

    if (!writeFile(key_path, key_pem, 0600) || !writeFile(cert_path, cert_pem, 0644)) {
        return false;
    }

    cert_   = std::move(x);
    key_    = std::move(key);
    ca_pem_ = cert_pem;
    LP_LOG(INFO, "CA: created new authority at %s", cert_path.c_str());
    return true;
}

// ---------------------------------------------------------------------------
// issue
// ---------------------------------------------------------------------------
bool CertificateAuthority::issue(const std::string& common_name,
                                 const std::string& public_key_pem,
                                 CertificateBundle& bundle) {
    if (!loaded()) {
        LP_LOG(ERR, "CA: issue() before ensureCa()");
        return false;
    }

    EvpPkeyPtr client_key;
    bool generated = false;
    if (public_key_pem.empty()) {
        client_key = generateEcKey();
        generated  = true;
    } else {
        client_key = parsePublicKeyPem(public_key_pem);
        if (!client_key) LP_LOG(WARN, "CA: client supplied an unreadable public key");
    }
    if (!client_key) return false;

    X509Ptr x(X509_new());
    if (!x) { logSslErrors("X509_new"); return false; }

    X509_set_version(x.get(), 2);
    bool ok = randomSerial(x.get());

    X509_gmtime_adj(X509_getm_notBefore(x.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(x.get()), 86400L * CLIENT_VALIDITY_DAYS);
    X509_set_pubkey(x.get(), client_key.get());

    const std::string cn = common_name.empty() ? "linuxplay-client" : common_name;
    ok = ok && setCommonName(X509_get_subject_name(x.get()), cn);
    ok = ok && X509_set_issuer_name(x.get(), X509_get_subject_name(cert_.get())) == 1;
    ok = ok && addExtension(x.get(), cert_.get(), NID_basic_constraints, "critical,CA:FALSE");
    ok = ok && addExtension(x.get(), cert_.get(), NID_ext_key_usage, "clientAuth");

    if (!ok || X509_sign(x.get(), key_.get(), EVP_sha256()) == 0) {
        logSslErrors("issue");
        return false;
    }

    CertificateBundle out;
    out.client_cert_pem = certificateToPem(x.get());
    out.host_ca_pem     = ca_pem_;
    out.fingerprint     = publicKeyFingerprint(client_key.get());
    if (generated) out.client_key_pem = privateKeyToPem(client_key.get());

    if (out.client_cert_pem.empty() || out.fingerprint.empty() ||
        (generated && out.client_key_pem.empty())) {
        return false;
    }

    bundle = std::move(out);
    LP_LOG(INFO, "CA: issued certificate for '%s' (%s)", cn.c_str(), bundle.fingerprint.c_str());
    return true;
}

// ---------------------------------------------------------------------------
// verify
// ---------------------------------------------------------------------------
bool CertificateAuthority::verify(const std::string& cert_pem, std::string& fingerprint) const {
    if (!loaded()) return false;

    X509Ptr cert = parseCertificatePem(cert_pem);
    if (!cert) {
        LP_LOG(DEBUG, "CA: presented certificate does not parse");
        return false;
    }

    if (X509_NAME_cmp(X509_get_issuer_name(cert.get()),
                      X509_get_subject_name(cert_.get())) != 0) {
        LP_LOG(DEBUG, "CA: issuer mismatch");
        return false;
    }

    if (X509_verify(cert.get(), key_.get()) != 1) {
        ERR_clear_error();
        LP_LOG(DEBUG, "CA: signature does not verify");
        return false;
    }

    if (X509_cmp_current_time(X509_get0_notBefore(cert.get())) > 0 ||
        X509_cmp_current_time(X509_get0_notAfter(cert.get())) < 0) {
        LP_LOG(DEBUG, "CA: certificate outside its validity window");
        return false;
    }

    EVP_PKEY* pub = X509_get0_pubkey(cert.get());
    fingerprint = publicKeyFingerprint(pub);
    return !fingerprint.empty();
}

} // namespace lp::host
