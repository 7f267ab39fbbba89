#include <gtest/gtest.h>

#include "auth/certificate_authority.h"
#include <lp/crypto/openssl_util.h>

#include "test_util.h"

#include <openssl/pem.h>
#include <sys/stat.h>

using namespace lp;
using namespace lp::host;

namespace {

std::string publicKeyPem(EVP_PKEY* key) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key) != 1) return "";
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

} // namespace

TEST(CertificateAuthority, CreatesThenReloadsSameCa) {
    test::TempDir dir;
    std::string first_pem;
    {
        CertificateAuthority ca;
        ASSERT_TRUE(ca.ensureCa(dir.path()));
        EXPECT_TRUE(ca.loaded());
        first_pem = ca.caCertPem();
        EXPECT_NE(first_pem.find("BEGIN CERTIFICATE"), std::string::npos);
    }
    EXPECT_TRUE(test::fileExists(dir.file(CertificateAuthority::CA_CERT_FILE)));
    EXPECT_TRUE(test::fileExists(dir.file(CertificateAuthority::CA_KEY_FILE)));

    struct stat st{};
    ASSERT_EQ(::stat(dir.file(CertificateAuthority::CA_KEY_FILE).c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0077, 0u);

    CertificateAuthority again;
    ASSERT_TRUE(again.ensureCa(dir.path()));
    EXPECT_EQ(again.caCertPem(), first_pem);
}

TEST(CertificateAuthority, IssueWithGeneratedKey) {
    test::TempDir dir;
    CertificateAuthority ca;
    ASSERT_TRUE(ca.ensureCa(dir.path()));

    CertificateBundle bundle;
    ASSERT_TRUE(ca.issue("laptop", "", bundle));
    EXPECT_FALSE(bundle.client_cert_pem.empty());
    EXPECT_FALSE(bundle.client_key_pem.empty());
    EXPECT_EQ(bundle.host_ca_pem, ca.caCertPem());
    EXPECT_EQ(bundle.fingerprint.size(), 32u * 3 - 1);

    std::string fp;
    ASSERT_TRUE(ca.verify(bundle.client_cert_pem, fp));
    EXPECT_EQ(fp, bundle.fingerprint);
}

TEST(CertificateAuthority, IssueForSuppliedKeyKeepsFingerprint) {
    test::TempDir dir;
    CertificateAuthority ca;
    ASSERT_TRUE(ca.ensureCa(dir.path()));

    EvpPkeyPtr client_key = generateEcKey();
    ASSERT_TRUE(client_key);
    const std::string pub = publicKeyPem(client_key.get());
    ASSERT_FALSE(pub.empty());

    CertificateBundle bundle;
    ASSERT_TRUE(ca.issue("desk", pub, bundle));
    EXPECT_TRUE(bundle.client_key_pem.empty());
    EXPECT_EQ(bundle.fingerprint, publicKeyFingerprint(client_key.get()));

    X509Ptr cert = parseCertificatePem(bundle.client_cert_pem);
    ASSERT_TRUE(cert);
}

TEST(CertificateAuthority, RejectsForeignAndGarbageCertificates) {
    test::TempDir a_dir, b_dir;
    CertificateAuthority a, b;
    ASSERT_TRUE(a.ensureCa(a_dir.path()));
    ASSERT_TRUE(b.ensureCa(b_dir.path()));

    CertificateBundle from_b;
    ASSERT_TRUE(b.issue("other", "", from_b));

    std::string fp;
    EXPECT_FALSE(a.verify(from_b.client_cert_pem, fp));
    EXPECT_FALSE(a.verify("not a certificate", fp));
    EXPECT_FALSE(a.verify("", fp));
}

TEST(CertificateAuthority, RejectsMalformedPublicKey) {
    test::TempDir dir;
    CertificateAuthority ca;
    ASSERT_TRUE(ca.ensureCa(dir.path()));

    CertificateBundle bundle;
    EXPECT_FALSE(ca.issue("x", "-----BEGIN PUBLIC KEY-----\nAAAA\n-----END PUBLIC KEY-----\n",
                          bundle));
}
