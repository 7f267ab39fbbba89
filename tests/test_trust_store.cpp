#include <gtest/gtest.h>

#include "auth/trust_store.h"

#include "test_util.h"

using namespace lp;
using namespace lp::host;

namespace {

TrustedClient client(const std::string& fp, const std::string& name) {
    TrustedClient c;
    c.fingerprint = fp;
    c.common_name = name;
    c.issued_on   = TrustStore::isoTimestampUtc();
    return c;
}

} // namespace

TEST(TrustStore, MissingFileIsEmpty) {
    test::TempDir dir;
    TrustStore store(dir.file(TrustStore::FILE_NAME));
    ASSERT_TRUE(store.load());
    EXPECT_TRUE(store.list().empty());
}

TEST(TrustStore, CorruptFileIsError) {
    test::TempDir dir;
    ASSERT_TRUE(test::writeText(dir.file(TrustStore::FILE_NAME), "{not json"));
    TrustStore store(dir.file(TrustStore::FILE_NAME));
    EXPECT_FALSE(store.load());
}

TEST(TrustStore, InsertPersistsAcrossReload) {
    test::TempDir dir;
    const std::string path = dir.file(TrustStore::FILE_NAME);
    {
        TrustStore store(path);
        ASSERT_TRUE(store.load());
        AuthError err = AuthError::InvalidPin;
        ASSERT_TRUE(store.tryInsert(client("AA:01", "laptop"), err));
        EXPECT_EQ(err, AuthError::None);
    }
    EXPECT_FALSE(test::fileExists(path + ".tmp"));

    TrustStore reloaded(path);
    ASSERT_TRUE(reloaded.load());
    TrustedClient c;
    ASSERT_TRUE(reloaded.lookup("AA:01", c));
    EXPECT_EQ(c.common_name, "laptop");
    EXPECT_FALSE(c.revoked);
    EXPECT_EQ(c.issued_on.size(), 20u);
}

TEST(TrustStore, DuplicateIsAlreadyIssued) {
    test::TempDir dir;
    TrustStore store(dir.file(TrustStore::FILE_NAME));
    ASSERT_TRUE(store.load());

    AuthError err = AuthError::None;
    ASSERT_TRUE(store.tryInsert(client("AA:02", "a"), err));
    EXPECT_FALSE(store.tryInsert(client("AA:02", "b"), err));
    EXPECT_EQ(err, AuthError::AlreadyIssued);

    TrustedClient c;
    ASSERT_TRUE(store.lookup("AA:02", c));
    EXPECT_EQ(c.common_name, "a");
}

TEST(TrustStore, RevokePersistsAndAllowsReissue) {
    test::TempDir dir;
    const std::string path = dir.file(TrustStore::FILE_NAME);
    TrustStore store(path);
    ASSERT_TRUE(store.load());

    AuthError err = AuthError::None;
    ASSERT_TRUE(store.tryInsert(client("AA:03", "old"), err));
    ASSERT_TRUE(store.revoke("AA:03"));
    EXPECT_FALSE(store.revoke("ZZ:99"));

    {
        TrustStore reloaded(path);
        ASSERT_TRUE(reloaded.load());
        TrustedClient c;
        ASSERT_TRUE(reloaded.lookup("AA:03", c));
        EXPECT_TRUE(c.revoked);
    }

    ASSERT_TRUE(store.tryInsert(client("AA:03", "new"), err));
    TrustedClient c;
    ASSERT_TRUE(store.lookup("AA:03", c));
    EXPECT_FALSE(c.revoked);
    EXPECT_EQ(c.common_name, "new");
}

TEST(TrustStore, UnwritableDirectoryRollsBack) {
    TrustStore store("/nonexistent-linuxplay-dir/trusted_clients.json");
    ASSERT_TRUE(store.load());

    AuthError err = AuthError::InvalidPin;
    EXPECT_FALSE(store.tryInsert(client("AA:04", "x"), err));
    EXPECT_EQ(err, AuthError::None);
    TrustedClient c;
    EXPECT_FALSE(store.lookup("AA:04", c));
}
