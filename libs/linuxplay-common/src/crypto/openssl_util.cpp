///////////////////////////////////////////////////////////////////////////////
// openssl_util.cpp -- OpenSSL helpers
///////////////////////////////////////////////////////////////////////////////

#include <lp/crypto/openssl_util.h>
#include <lp/common.h>

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>

#include <cstdio>
#include <vector>

namespace lp {

// ---------------------------------------------------------------------------
// OpenSSL one-time initializer
// ---------------------------------------------------------------------------
void ensureOpenSslInit() {
    static bool done = [] {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS |
                         OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
        return true;
    }();
    (void)done;
}

void logSslErrors(const char* context) {
    unsigned long err;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        LP_LOG(ERR, "OpenSSL [%s]: %s", context, buf);
    }
}

// ---------------------------------------------------------------------------
// generateEcKey -- prime256v1
// ---------------------------------------------------------------------------
EvpPkeyPtr generateEcKey() {
    ensureOpenSslInit();

    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
    if (!pctx) { logSslErrors("EVP_PKEY_CTX_new_id"); return nullptr; }

    EVP_PKEY* pkey = nullptr;
    bool ok = (EVP_PKEY_keygen_init(pctx) == 1) &&
              (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx, NID_X9_62_prime256v1) == 1) &&
              (EVP_PKEY_keygen(pctx, &pkey) == 1);

    EVP_PKEY_CTX_free(pctx);
    if (!ok) {
        logSslErrors("generateEcKey");
        if (pkey) EVP_PKEY_free(pkey);
        return nullptr;
    }
    return EvpPkeyPtr(pkey);
}

// ---------------------------------------------------------------------------
// PEM conversion
// ---------------------------------------------------------------------------
X509Ptr parseCertificatePem(const std::string& pem) {
    ensureOpenSslInit();
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) return nullptr;
    X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    if (!cert) {
        // Garbage from the network is not a host error.
        ERR_clear_error();
        return nullptr;
    }
    return X509Ptr(cert);
}

EvpPkeyPtr parsePublicKeyPem(const std::string& pem) {
    ensureOpenSslInit();
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) return nullptr;
    EVP_PKEY* key = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
    if (!key) {
        ERR_clear_error();
        return nullptr;
    }
    return EvpPkeyPtr(key);
}

EvpPkeyPtr parsePrivateKeyPem(const std::string& pem) {
    ensureOpenSslInit();
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) return nullptr;
    EVP_PKEY* key = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!key) {
        logSslErrors("PEM_read_bio_PrivateKey");
        return nullptr;
    }
    return EvpPkeyPtr(key);
}

namespace {

std::string drainBio(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || !data) return {};
    return std::string(data, static_cast<size_t>(len));
}

} // anonymous namespace

std::string certificateToPem(X509* cert) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509(bio.get(), cert) != 1) {
        logSslErrors("PEM_write_bio_X509");
        return {};
    }
    return drainBio(bio.get());
}

std::string privateKeyToPem(EVP_PKEY* key) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0,
                                         nullptr, nullptr) != 1) {
        logSslErrors("PEM_write_bio_PrivateKey");
        return {};
    }
    return drainBio(bio.get());
}

// ---------------------------------------------------------------------------
// publicKeyFingerprint -- SHA-256 of the DER SubjectPublicKeyInfo
// ---------------------------------------------------------------------------
std::string publicKeyFingerprint(EVP_PKEY* key) {
    if (!key) return {};

    unsigned char* der = nullptr;
    int der_len = i2d_PUBKEY(key, &der);
    if (der_len <= 0) {
        logSslErrors("i2d_PUBKEY");
        return {};
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int  mdLen = 0;
    int ok = EVP_Digest(der, static_cast<size_t>(der_len), md, &mdLen,
                        EVP_sha256(), nullptr);
    OPENSSL_free(der);
    if (ok != 1) {
        logSslErrors("EVP_Digest");
        return {};
    }

    // Format as colon-separated hex
    std::string result;
    result.reserve(mdLen * 3);
    for (unsigned int i = 0; i < mdLen; ++i) {
        char hex[4];
        std::snprintf(hex, sizeof(hex), "%02X", md[i]);
        if (i > 0) result += ':';
        result += hex;
    }
    return result;
}

// ---------------------------------------------------------------------------
// Possession signatures -- ECDSA/SHA-256, hex on the wire
// ---------------------------------------------------------------------------
namespace {

struct MdCtxDeleter { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool decodeHex(const std::string& hex, std::vector<unsigned char>& out) {
    if (hex.empty() || hex.size() % 2 != 0) return false;
    out.clear();
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexNibble(hex[i]);
        int lo = hexNibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return true;
}

} // anonymous namespace

bool signMessage(EVP_PKEY* key, const std::string& message, std::string& signature_hex) {
    if (!key) return false;
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1) {
        logSslErrors("EVP_DigestSignInit");
        return false;
    }

    const auto* msg = reinterpret_cast<const unsigned char*>(message.data());
    size_t sig_len = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, msg, message.size()) != 1) {
        logSslErrors("EVP_DigestSign");
        return false;
    }
    std::vector<unsigned char> sig(sig_len);
    if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, msg, message.size()) != 1) {
        logSslErrors("EVP_DigestSign");
        return false;
    }

    signature_hex.clear();
    signature_hex.reserve(sig_len * 2);
    for (size_t i = 0; i < sig_len; ++i) {
        char hex[3];
        std::snprintf(hex, sizeof(hex), "%02x", sig[i]);
        signature_hex += hex;
    }
    return true;
}

bool verifyMessage(EVP_PKEY* key, const std::string& message,
                   const std::string& signature_hex) {
    std::vector<unsigned char> sig;
    if (!key || !decodeHex(signature_hex, sig)) return false;

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1) {
        logSslErrors("EVP_DigestVerifyInit");
        return false;
    }
    int rc = EVP_DigestVerify(ctx.get(), sig.data(), sig.size(),
                              reinterpret_cast<const unsigned char*>(message.data()),
                              message.size());
    // A bad signature from the network is not a host error.
    ERR_clear_error();
    return rc == 1;
}

} // namespace lp
