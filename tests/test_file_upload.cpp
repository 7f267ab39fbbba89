#include <gtest/gtest.h>

#include "channels/file_upload.h"

#include "test_util.h"

#include <lp/common.h>
#include <lp/net/tcp_util.h>

using namespace lp;
using namespace lp::host;

namespace {

std::string frame(const std::string& name, const std::string& data, uint64_t claimed_size) {
    std::string out;
    const uint32_t n = static_cast<uint32_t>(name.size());
    out += static_cast<char>(n >> 24);
    out += static_cast<char>(n >> 16);
    out += static_cast<char>(n >> 8);
    out += static_cast<char>(n);
    out += name;
    for (int shift = 56; shift >= 0; shift -= 8) {
        out += static_cast<char>((claimed_size >> shift) & 0xFF);
    }
    out += data;
    return out;
}

bool send(uint16_t port, const std::string& bytes) {
    int fd = connectTcp("127.0.0.1", port, 2000);
    if (fd < 0) return false;
    bool ok = writeAll(fd, bytes);
    lp_close_socket(fd);
    return ok;
}

} // namespace

TEST(ResolveUploadPath, AcceptsBareNames) {
    std::string path;
    ASSERT_TRUE(resolveUploadPath("/srv/drop/", "notes.txt", 10, 100, path));
    EXPECT_EQ(path, "/srv/drop/notes.txt");
    ASSERT_TRUE(resolveUploadPath("", "a", 0, 0, path));
    EXPECT_EQ(path, "./a");
}

TEST(ResolveUploadPath, RejectsTraversalAndOversize) {
    std::string path, why;
    EXPECT_FALSE(resolveUploadPath("/d", "", 1, 100, path, &why));
    EXPECT_FALSE(resolveUploadPath("/d", ".", 1, 100, path, &why));
    EXPECT_FALSE(resolveUploadPath("/d", "..", 1, 100, path, &why));
    EXPECT_FALSE(resolveUploadPath("/d", "../etc/passwd", 1, 100, path, &why));
    EXPECT_FALSE(resolveUploadPath("/d", "sub/file", 1, 100, path, &why));
    EXPECT_FALSE(resolveUploadPath("/d", "win\\path", 1, 100, path, &why));
    EXPECT_FALSE(resolveUploadPath("/d", std::string("a\0b", 3), 1, 100, path, &why));
    EXPECT_FALSE(resolveUploadPath("/d", std::string(256, 'x'), 1, 100, path, &why));
    EXPECT_FALSE(resolveUploadPath("/d", "big.bin", 101, 100, path, &why));
    EXPECT_EQ(why, "file too large");
}

TEST(FileUploadServer, ReceivesFile) {
    test::TempDir dir;
    const std::string drop = dir.file("uploads");
    FileUploadServer server(drop, 1024);
    ASSERT_TRUE(server.start("127.0.0.1", 0, "127.0.0.1"));
    ASSERT_NE(server.boundPort(), 0);

    const std::string payload = "hello from the viewer";
    ASSERT_TRUE(send(server.boundPort(), frame("greeting.txt", payload, payload.size())));
    ASSERT_TRUE(test::waitFor([&] { return server.filesReceived() == 1; }, 3000));

    EXPECT_EQ(test::readText(drop + "/greeting.txt"), payload);
    EXPECT_FALSE(test::fileExists(drop + "/greeting.txt.part"));
    server.stop();
}

TEST(FileUploadServer, DiscardsTruncatedTransfer) {
    test::TempDir dir;
    FileUploadServer server(dir.path(), 1024);
    ASSERT_TRUE(server.start("127.0.0.1", 0, ""));

    ASSERT_TRUE(send(server.boundPort(), frame("short.bin", "abc", 10)));
    // Followed by a good upload so there is something to wait for.
    ASSERT_TRUE(send(server.boundPort(), frame("ok.bin", "xyz", 3)));
    ASSERT_TRUE(test::waitFor([&] { return server.filesReceived() == 1; }, 3000));

    EXPECT_FALSE(test::fileExists(dir.file("short.bin")));
    EXPECT_FALSE(test::fileExists(dir.file("short.bin.part")));
    EXPECT_TRUE(test::fileExists(dir.file("ok.bin")));
    server.stop();
}

TEST(FileUploadServer, RejectsTraversalAndOversize) {
    test::TempDir dir;
    FileUploadServer server(dir.file("in"), 8);
    ASSERT_TRUE(server.start("127.0.0.1", 0, ""));

    ASSERT_TRUE(send(server.boundPort(), frame("../escape.txt", "data", 4)));
    ASSERT_TRUE(send(server.boundPort(), frame("huge.bin", "0123456789", 10)));
    ASSERT_TRUE(send(server.boundPort(), frame("fine.txt", "ok", 2)));
    ASSERT_TRUE(test::waitFor([&] { return server.filesReceived() == 1; }, 3000));

    EXPECT_FALSE(test::fileExists(dir.file("escape.txt")));
    EXPECT_FALSE(test::fileExists(dir.file("in/huge.bin")));
    EXPECT_TRUE(test::fileExists(dir.file("in/fine.txt")));
    server.stop();
}

TEST(FileUploadServer, DropsConnectionsFromOtherPeers) {
    test::TempDir dir;
    FileUploadServer server(dir.path(), 1024);
    ASSERT_TRUE(server.start("127.0.0.1", 0, "10.255.255.1"));

    ASSERT_TRUE(send(server.boundPort(), frame("x.txt", "x", 1)));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(server.filesReceived(), 0u);
    EXPECT_FALSE(test::fileExists(dir.file("x.txt")));
    server.stop();
}
