#include <gtest/gtest.h>

#include "input/gamepad_mapper.h"

using namespace lp;
using namespace lp::host;

namespace {

GamepadEvent key(int16_t code, int16_t value) {
    GamepadEvent e;
    e.type  = EVDEV_EV_KEY;
    e.code  = code;
    e.value = value;
    return e;
}

GamepadEvent hat(int16_t code, int16_t value) {
    GamepadEvent e;
    e.type  = EVDEV_EV_ABS;
    e.code  = code;
    e.value = value;
    return e;
}

} // namespace

TEST(GamepadMapper, PassesThroughAxesAndButtons) {
    GamepadMapper mapper;
    std::vector<GamepadEvent> out;

    GamepadEvent axis;
    axis.type  = EVDEV_EV_ABS;
    axis.code  = 0x00;
    axis.value = -12000;
    mapper.map(axis, out);
    mapper.map(key(0x130, 1), out);   // BTN_SOUTH

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], axis);
    EXPECT_EQ(out[1], key(0x130, 1));
}

TEST(GamepadMapper, DpadKeysBecomeHat) {
    GamepadMapper mapper;
    std::vector<GamepadEvent> out;

    mapper.map(key(EVDEV_KEY_LEFT, 1), out);
    mapper.map(key(EVDEV_KEY_LEFT, 0), out);
    mapper.map(key(EVDEV_KEY_DOWN, 1), out);
    mapper.map(key(EVDEV_KEY_UP, 1), out);

    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0], hat(EVDEV_ABS_HAT0X, -1));
    EXPECT_EQ(out[1], hat(EVDEV_ABS_HAT0X, 0));
    EXPECT_EQ(out[2], hat(EVDEV_ABS_HAT0Y, 1));
    // Up and down together cancel.
    EXPECT_EQ(out[3], hat(EVDEV_ABS_HAT0Y, 0));
}

TEST(GamepadMapper, ResetForgetsHeldKeys) {
    GamepadMapper mapper;
    std::vector<GamepadEvent> out;
    mapper.map(key(EVDEV_KEY_RIGHT, 1), out);
    mapper.reset();
    mapper.map(key(EVDEV_KEY_LEFT, 1), out);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1], hat(EVDEV_ABS_HAT0X, -1));
}
