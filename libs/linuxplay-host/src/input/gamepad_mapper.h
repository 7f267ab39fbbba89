///////////////////////////////////////////////////////////////////////////////
// gamepad_mapper.h -- Viewer gamepad events -> virtual pad events
//
// Most controllers report the D-pad as a hat, but some drivers on the
// viewer side expose it as KEY_UP/DOWN/LEFT/RIGHT.  Those are folded into
// ABS_HAT0X / ABS_HAT0Y here so the virtual pad always looks like a
// standard controller.  Opposite directions held together cancel out.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/control/control_message.h>

#include <vector>

namespace lp::host {

// evdev constants used on the wire (linux/input-event-codes.h values).
constexpr uint8_t EVDEV_EV_SYN     = 0x00;
constexpr uint8_t EVDEV_EV_KEY     = 0x01;
constexpr uint8_t EVDEV_EV_ABS     = 0x03;
constexpr int16_t EVDEV_KEY_UP     = 103;
constexpr int16_t EVDEV_KEY_LEFT   = 105;
constexpr int16_t EVDEV_KEY_RIGHT  = 106;
constexpr int16_t EVDEV_KEY_DOWN   = 108;
constexpr int16_t EVDEV_ABS_HAT0X  = 0x10;
constexpr int16_t EVDEV_ABS_HAT0Y  = 0x11;

class GamepadMapper {
public:
    /// Translate one wire event.  Appends zero or more output events.
    void map(const GamepadEvent& in, std::vector<GamepadEvent>& out);

    /// Forget held D-pad keys (new session).
    void reset();

private:
    bool left_  = false;
    bool right_ = false;
    bool up_    = false;
    bool down_  = false;
};

} // namespace lp::host
