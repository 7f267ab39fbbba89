///////////////////////////////////////////////////////////////////////////////
// gamepad_mapper.cpp -- D-pad key to hat translation
///////////////////////////////////////////////////////////////////////////////

#include "gamepad_mapper.h"

namespace lp::host {

void GamepadMapper::map(const GamepadEvent& in, std::vector<GamepadEvent>& out) {
    if (in.type != EVDEV_EV_KEY) {
        out.push_back(in);
        return;
    }

    const bool pressed = in.value != 0;
    bool horizontal = true;
    switch (in.code) {
        case EVDEV_KEY_LEFT:  left_  = pressed; break;
        case EVDEV_KEY_RIGHT: right_ = pressed; break;
        case EVDEV_KEY_UP:    up_    = pressed; horizontal = false; break;
        case EVDEV_KEY_DOWN:  down_  = pressed; horizontal = false; break;
        default:
            out.push_back(in);
            return;
    }

    GamepadEvent hat;
    hat.type = EVDEV_EV_ABS;
    if (horizontal) {
        hat.code  = EVDEV_ABS_HAT0X;
        hat.value = static_cast<int16_t>((right_ ? 1 : 0) - (left_ ? 1 : 0));
    } else {
        hat.code  = EVDEV_ABS_HAT0Y;
        hat.value = static_cast<int16_t>((down_ ? 1 : 0) - (up_ ? 1 : 0));
    }
    out.push_back(hat);
}

void GamepadMapper::reset() {
    left_ = right_ = up_ = down_ = false;
}

} // namespace lp::host
