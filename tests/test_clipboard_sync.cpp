#include <gtest/gtest.h>

#include "input/clipboard_sync.h"

#include <lp/control/control_message.h>

#include <mutex>
#include <vector>

using namespace lp;
using namespace lp::host;

namespace {

struct FakeClipboardState {
    std::mutex  mutex;
    std::string text;
    bool        readable = true;
    int         sets     = 0;
};

class FakeClipboard : public IClipboardBackend {
public:
    explicit FakeClipboard(std::shared_ptr<FakeClipboardState> s) : s_(std::move(s)) {}

    bool get(std::string& text) override {
        std::lock_guard<std::mutex> lock(s_->mutex);
        if (!s_->readable) return false;
        text = s_->text;
        return true;
    }
    bool set(const std::string& text) override {
        std::lock_guard<std::mutex> lock(s_->mutex);
        s_->text = text;
        ++s_->sets;
        return true;
    }

private:
    std::shared_ptr<FakeClipboardState> s_;
};

std::string fromViewer(const std::string& text) {
    ClipboardMessage m;
    m.from_host = false;
    m.text      = text;
    return m.serialize();
}

class ClipboardSyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<FakeClipboardState>();
        state_->text = "already there";
        sync_ = std::make_unique<ClipboardSync>(std::make_unique<FakeClipboard>(state_));
        ASSERT_TRUE(sync_->start([this](const std::string& d) {
            std::lock_guard<std::mutex> lock(sent_mutex_);
            sent_.push_back(d);
        }));
    }

    void TearDown() override { sync_->stop(); }

    void deliver(const std::string& datagram) {
        sync_->onDatagram(reinterpret_cast<const uint8_t*>(datagram.data()), datagram.size());
    }

    void setHostText(const std::string& t) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->text = t;
    }

    std::vector<std::string> sent() {
        std::lock_guard<std::mutex> lock(sent_mutex_);
        return sent_;
    }

    std::shared_ptr<FakeClipboardState> state_;
    std::unique_ptr<ClipboardSync>      sync_;
    std::mutex                          sent_mutex_;
    std::vector<std::string>            sent_;
};

} // namespace

TEST_F(ClipboardSyncTest, ExistingContentIsNotSent) {
    sync_->pollOnce();
    EXPECT_TRUE(sent().empty());
}

TEST_F(ClipboardSyncTest, HostChangeIsSentOnce) {
    setHostText("copied on host");
    sync_->pollOnce();
    sync_->pollOnce();

    auto out = sent();
    ASSERT_EQ(out.size(), 1u);
    ClipboardMessage m;
    ASSERT_TRUE(ClipboardMessage::parse(out[0], m));
    EXPECT_TRUE(m.from_host);
    EXPECT_EQ(m.text, "copied on host");
    EXPECT_EQ(sync_->updatesSent(), 1u);
}

TEST_F(ClipboardSyncTest, ViewerUpdateIsAppliedWithoutEcho) {
    deliver(fromViewer("from viewer\nline 2"));
    EXPECT_EQ(sync_->updatesApplied(), 1u);
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        EXPECT_EQ(state_->text, "from viewer\nline 2");
    }

    sync_->pollOnce();
    EXPECT_TRUE(sent().empty());

    // Same text again is not re-applied.
    deliver(fromViewer("from viewer\nline 2"));
    EXPECT_EQ(state_->sets, 1);
}

TEST_F(ClipboardSyncTest, HostOriginAndMalformedAreIgnored) {
    ClipboardMessage echo;
    echo.from_host = true;
    echo.text      = "loop";
    deliver(echo.serialize());
    deliver("GARBAGE");
    EXPECT_EQ(sync_->updatesApplied(), 0u);
    EXPECT_EQ(state_->sets, 0);
}

TEST_F(ClipboardSyncTest, OversizedHostTextIsNotSent) {
    setHostText(std::string(MAX_CLIPBOARD_BYTES + 1, 'x'));
    sync_->pollOnce();
    EXPECT_TRUE(sent().empty());
}

TEST_F(ClipboardSyncTest, UnreadableClipboardIsSkipped) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->readable = false;
        state_->text     = "hidden";
    }
    sync_->pollOnce();
    EXPECT_TRUE(sent().empty());
}
