#include <gtest/gtest.h>

#include "auth/pin_manager.h"

#include "test_util.h"

#include <atomic>
#include <set>
#include <thread>

using namespace lp;
using namespace lp::host;

TEST(PinManager, GeneratesZeroPaddedDigits) {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        std::string pin;
        ASSERT_TRUE(PinManager::generatePin(6, pin));
        ASSERT_EQ(pin.size(), 6u);
        EXPECT_EQ(pin.find_first_not_of("0123456789"), std::string::npos);
        seen.insert(pin);
    }
    EXPECT_GT(seen.size(), 150u);

    std::string pin;
    EXPECT_FALSE(PinManager::generatePin(0, pin));
    EXPECT_FALSE(PinManager::generatePin(10, pin));
}

TEST(PinManager, VerifyMatchesCurrentOnly) {
    PinManager pins(60'000);
    ASSERT_TRUE(pins.start());
    const std::string pin = pins.current();
    ASSERT_EQ(pin.size(), PinManager::PIN_DIGITS);

    EXPECT_EQ(pins.verify(pin), AuthError::None);
    EXPECT_EQ(pins.verify(""), AuthError::InvalidPin);
    EXPECT_EQ(pins.verify(pin + "0"), AuthError::InvalidPin);

    std::string wrong = pin;
    wrong[0] = (wrong[0] == '9') ? '0' : static_cast<char>(wrong[0] + 1);
    EXPECT_EQ(pins.verify(wrong), AuthError::InvalidPin);
    pins.stop();
}

TEST(PinManager, RotatesOnInterval) {
    PinManager pins(50);
    std::atomic<int> callbacks{0};
    pins.setRotateCallback([&](const std::string&) { ++callbacks; });
    ASSERT_TRUE(pins.start());

    EXPECT_TRUE(test::waitFor([&] { return pins.rotationCount() >= 3; }, 2000));
    EXPECT_GE(callbacks.load(), 3);
    pins.stop();
}

TEST(PinManager, OldPinRejectedAfterRotation) {
    PinManager pins(60'000);
    ASSERT_TRUE(pins.start());
    std::string old = pins.current();
    do {
        ASSERT_TRUE(pins.rotateNow());
    } while (pins.current() == old);
    EXPECT_EQ(pins.verify(old), AuthError::InvalidPin);
    EXPECT_EQ(pins.verify(pins.current()), AuthError::None);
    pins.stop();
}

TEST(PinManager, PauseHoldsPinAndResumeIssuesFreshOne) {
    PinManager pins(50);
    ASSERT_TRUE(pins.start());
    pins.pause();
    EXPECT_TRUE(pins.paused());

    const uint64_t count = pins.rotationCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(pins.rotationCount(), count);

    pins.resume();
    EXPECT_FALSE(pins.paused());
    EXPECT_EQ(pins.rotationCount(), count + 1);

    // Resume while not paused is a no-op.
    pins.resume();
    EXPECT_LE(pins.rotationCount(), count + 2);
    pins.stop();
}

TEST(PinManager, StalePinIsExpired) {
    PinManager pins(30);
    ASSERT_TRUE(pins.rotateNow());   // no rotation thread
    const std::string pin = pins.current();
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    EXPECT_EQ(pins.verify(pin), AuthError::Expired);
}
