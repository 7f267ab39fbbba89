///////////////////////////////////////////////////////////////////////////////
// input_injector.h -- Host-side input injection interface
//
// Pointer, keyboard and gamepad events decoded from the control and gamepad
// channels are delivered to one IInputInjector, chosen at startup:
//
//   xdotool   LinuxInputInjector (xdotool for pointer/keys, uinput gamepad)
//   none      NullInputInjector  (counts and discards)
//
// Missing tools or devices degrade gracefully: a warning is logged once and
// the affected events are dropped.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/control/control_message.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace lp::host {

class IInputInjector {
public:
    virtual ~IInputInjector() = default;

    /// MOUSE_PKT: move to (x, y) and press/release the buttons in the mask.
    virtual void injectPointer(int type, int button_mask, int x, int y) = 0;

    /// MOUSE_SCROLL: X button 4..7.
    virtual void injectScroll(int button) = 0;

    /// KEY_PRESS / KEY_RELEASE with an X keysym name.
    virtual void injectKey(const std::string& keysym, bool down) = 0;

    /// One already-translated evdev event for the virtual gamepad.
    virtual void injectGamepad(const GamepadEvent& event) = 0;

    /// Release devices and wait for helper processes.
    virtual void shutdown() {}

    virtual const char* name() const = 0;
};

/// Route a parsed control message to the injector.  Returns false for
/// messages that are not input (NET, GOODBYE).
bool dispatchControl(IInputInjector& injector, const ControlMessage& msg);

// ---------------------------------------------------------------------------
// NullInputInjector
// ---------------------------------------------------------------------------
class NullInputInjector : public IInputInjector {
public:
    void injectPointer(int, int, int, int) override { ++pointer_events_; }
    void injectScroll(int) override { ++scroll_events_; }
    void injectKey(const std::string&, bool) override { ++key_events_; }
    void injectGamepad(const GamepadEvent&) override { ++gamepad_events_; }

    const char* name() const override { return "none"; }

    uint64_t pointerEvents() const { return pointer_events_.load(); }
    uint64_t scrollEvents() const { return scroll_events_.load(); }
    uint64_t keyEvents() const { return key_events_.load(); }
    uint64_t gamepadEvents() const { return gamepad_events_.load(); }

private:
    std::atomic<uint64_t> pointer_events_{0};
    std::atomic<uint64_t> scroll_events_{0};
    std::atomic<uint64_t> key_events_{0};
    std::atomic<uint64_t> gamepad_events_{0};
};

/// "xdotool" (default) or "none".  Unknown names fall back to "none" with a
/// warning.
std::unique_ptr<IInputInjector> createInputInjector(const std::string& kind,
                                                    const std::string& display);

} // namespace lp::host
