///////////////////////////////////////////////////////////////////////////////
// linux_input_injector.h -- X11 pointer/keyboard via xdotool, gamepad via
// a /dev/uinput virtual controller
//
// xdotool runs as short-lived helper processes on the configured DISPLAY.
// Helpers are reaped opportunistically; when too many are still running,
// pointer motion is dropped (the next move supersedes it) while button,
// scroll and key events are always issued.
//
// The virtual pad is created on the first gamepad event.  If /dev/uinput
// cannot be opened the failure is logged once and gamepad input dropped.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include "input_injector.h"

#include <lp/util/child_process.h>

#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lp::host {

class LinuxInputInjector : public IInputInjector {
public:
    static constexpr size_t MAX_PENDING_HELPERS = 16;

    explicit LinuxInputInjector(std::string display);
    ~LinuxInputInjector() override;

    LinuxInputInjector(const LinuxInputInjector&) = delete;
    LinuxInputInjector& operator=(const LinuxInputInjector&) = delete;

    /// Look for xdotool.  Returns false if it is not installed; the
    /// injector still works for the gamepad.
    bool initialize();

    void injectPointer(int type, int button_mask, int x, int y) override;
    void injectScroll(int button) override;
    void injectKey(const std::string& keysym, bool down) override;
    void injectGamepad(const GamepadEvent& event) override;
    void shutdown() override;

    const char* name() const override { return "xdotool"; }

    /// X keysym names are passed straight to xdotool; anything beyond
    /// [A-Za-z0-9_+-] is refused.
    static bool isValidKeysym(const std::string& keysym);

    /// xdotool argument list for a MOUSE_PKT.
    static std::vector<std::string> pointerArgs(int type, int button_mask, int x, int y);

private:
    void runXdotool(const std::vector<std::string>& args, bool droppable);
    void reapHelpersLocked();

    bool openGamepadLocked();
    void closeGamepadLocked();
    bool writeEventLocked(uint16_t type, uint16_t code, int32_t value);

    const std::string display_;
    bool              xdotool_available_ = false;

    std::mutex        helpers_mutex_;
    std::list<std::unique_ptr<ChildProcess>> helpers_;

    std::mutex        gamepad_mutex_;
    int               uinput_fd_       = -1;
    bool              gamepad_failed_  = false;
};

} // namespace lp::host
