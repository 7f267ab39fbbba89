///////////////////////////////////////////////////////////////////////////////
// linux_input_injector.cpp -- xdotool and uinput input injection
///////////////////////////////////////////////////////////////////////////////

#include "linux_input_injector.h"

#include <lp/common.h>

#include <fcntl.h>
#include <linux/input.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace lp::host {

namespace {

// Button bits in MOUSE_PKT masks, mapped to X button numbers 1..3.
constexpr int kMaskButtons[][2] = {{1, 1}, {2, 2}, {4, 3}};

const uint16_t kPadButtons[] = {
    BTN_SOUTH, BTN_EAST, BTN_NORTH, BTN_WEST,
    BTN_TL, BTN_TR, BTN_TL2, BTN_TR2,
    BTN_SELECT, BTN_START, BTN_MODE,
    BTN_THUMBL, BTN_THUMBR,
};

struct AxisRange {
    uint16_t code;
    int32_t  min;
    int32_t  max;
};

const AxisRange kPadAxes[] = {
    {ABS_X,     -32768, 32767},
    {ABS_Y,     -32768, 32767},
    {ABS_RX,    -32768, 32767},
    {ABS_RY,    -32768, 32767},
    {ABS_Z,          0,   255},
    {ABS_RZ,         0,   255},
    {ABS_HAT0X,     -1,     1},
    {ABS_HAT0Y,     -1,     1},
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// LinuxInputInjector
// ---------------------------------------------------------------------------
LinuxInputInjector::LinuxInputInjector(std::string display)
    : display_(std::move(display))
{
}

LinuxInputInjector::~LinuxInputInjector() {
    shutdown();
}

bool LinuxInputInjector::initialize() {
    std::string path;
    xdotool_available_ = captureCommandOutput("command -v xdotool", path);
    if (xdotool_available_) {
        LP_LOG(INFO, "Input: xdotool on DISPLAY=%s", display_.c_str());
    }
    return xdotool_available_;
}

void LinuxInputInjector::shutdown() {
    {
        std::lock_guard<std::mutex> lock(helpers_mutex_);
        for (auto& helper : helpers_) helper->stop(500);
        helpers_.clear();
    }
    std::lock_guard<std::mutex> lock(gamepad_mutex_);
    closeGamepadLocked();
}

bool LinuxInputInjector::isValidKeysym(const std::string& keysym) {
    if (keysym.empty() || keysym.size() > 64) return false;
    for (char c : keysym) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '+' && c != '-') {
            return false;
        }
    }
    return true;
}

std::vector<std::string> LinuxInputInjector::pointerArgs(int type, int button_mask,
                                                         int x, int y) {
    std::vector<std::string> args = {"mousemove", std::to_string(x), std::to_string(y)};
    if (type == MOUSE_MOVE) return args;

    const char* verb = (type == MOUSE_DOWN) ? "mousedown" : "mouseup";
    for (const auto& mb : kMaskButtons) {
        if (button_mask & mb[0]) {
            args.push_back(verb);
            args.push_back(std::to_string(mb[1]));
        }
    }
    return args;
}

void LinuxInputInjector::injectPointer(int type, int button_mask, int x, int y) {
    if (type != MOUSE_DOWN && type != MOUSE_MOVE && type != MOUSE_UP) {
        LP_LOG(DEBUG, "Input: ignoring mouse event type %d", type);
        return;
    }
    runXdotool(pointerArgs(type, button_mask, x, y), type == MOUSE_MOVE);
}

void LinuxInputInjector::injectScroll(int button) {
    if (button < 4 || button > 7) return;
    runXdotool({"click", std::to_string(button)}, false);
}

void LinuxInputInjector::injectKey(const std::string& keysym, bool down) {
    if (!isValidKeysym(keysym)) {
        LP_LOG(DEBUG, "Input: rejected key name '%s'", keysym.c_str());
        return;
    }
    runXdotool({down ? "keydown" : "keyup", keysym}, false);
}

void LinuxInputInjector::runXdotool(const std::vector<std::string>& args, bool droppable) {
    if (!xdotool_available_) return;

    std::lock_guard<std::mutex> lock(helpers_mutex_);
    reapHelpersLocked();
    if (droppable && helpers_.size() >= MAX_PENDING_HELPERS) {
        LP_LOG(TRACE, "Input: %zu helpers busy, dropping motion", helpers_.size());
        return;
    }

    std::vector<std::string> argv = {"env", "DISPLAY=" + display_, "xdotool"};
    argv.insert(argv.end(), args.begin(), args.end());

    auto helper = std::make_unique<ChildProcess>();
    if (!helper->start(argv)) {
        LP_LOG(WARN, "Input: failed to run xdotool %s", args.front().c_str());
        return;
    }
    helpers_.push_back(std::move(helper));
}

void LinuxInputInjector::reapHelpersLocked() {
    for (auto it = helpers_.begin(); it != helpers_.end();) {
        int code = 0;
        if ((*it)->poll(code)) {
            if (code != 0) LP_LOG(DEBUG, "Input: xdotool exited with %d", code);
            it = helpers_.erase(it);
        } else {
            ++it;
        }
    }
}

// ---------------------------------------------------------------------------
// Virtual gamepad
// ---------------------------------------------------------------------------
void LinuxInputInjector::injectGamepad(const GamepadEvent& event) {
    std::lock_guard<std::mutex> lock(gamepad_mutex_);
    if (uinput_fd_ < 0 && !openGamepadLocked()) return;

    if (event.type == EV_SYN) {
        writeEventLocked(EV_SYN, SYN_REPORT, 0);
        return;
    }
    if (event.type != EV_KEY && event.type != EV_ABS) {
        LP_LOG(TRACE, "Input: ignoring gamepad event type %u", event.type);
        return;
    }
    if (writeEventLocked(event.type, static_cast<uint16_t>(event.code), event.value)) {
        writeEventLocked(EV_SYN, SYN_REPORT, 0);
    }
}

bool LinuxInputInjector::openGamepadLocked() {
    if (gamepad_failed_) return false;

    int fd = ::open("/dev/uinput", O_WRONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        LP_LOG(WARN, "Input: cannot open /dev/uinput (%s), gamepad input disabled",
               std::strerror(errno));
        gamepad_failed_ = true;
        return false;
    }

    bool ok = ::ioctl(fd, UI_SET_EVBIT, EV_KEY) == 0 &&
              ::ioctl(fd, UI_SET_EVBIT, EV_ABS) == 0 &&
              ::ioctl(fd, UI_SET_EVBIT, EV_SYN) == 0;
    for (uint16_t button : kPadButtons) {
        ok = ok && ::ioctl(fd, UI_SET_KEYBIT, button) == 0;
    }
    for (const auto& axis : kPadAxes) {
        ok = ok && ::ioctl(fd, UI_SET_ABSBIT, axis.code) == 0;

        uinput_abs_setup abs{};
        abs.code          = axis.code;
        abs.absinfo.minimum = axis.min;
        abs.absinfo.maximum = axis.max;
        ok = ok && ::ioctl(fd, UI_ABS_SETUP, &abs) == 0;
    }

    uinput_setup setup{};
    setup.id.bustype = BUS_USB;
    setup.id.vendor  = 0x045e;    // presents as an Xbox 360 pad
    setup.id.product = 0x028e;
    setup.id.version = 1;
    std::snprintf(setup.name, UINPUT_MAX_NAME_SIZE, "LinuxPlay Virtual Gamepad");

    ok = ok && ::ioctl(fd, UI_DEV_SETUP, &setup) == 0 &&
               ::ioctl(fd, UI_DEV_CREATE) == 0;
    if (!ok) {
        LP_LOG(WARN, "Input: uinput device setup failed (%s), gamepad input disabled",
               std::strerror(errno));
        ::close(fd);
        gamepad_failed_ = true;
        return false;
    }

    uinput_fd_ = fd;
    LP_LOG(INFO, "Input: virtual gamepad created");
    return true;
}

void LinuxInputInjector::closeGamepadLocked() {
    if (uinput_fd_ < 0) return;
    ::ioctl(uinput_fd_, UI_DEV_DESTROY);
    ::close(uinput_fd_);
    uinput_fd_ = -1;
    LP_LOG(INFO, "Input: virtual gamepad removed");
}

bool LinuxInputInjector::writeEventLocked(uint16_t type, uint16_t code, int32_t value) {
    input_event ev{};
    ev.type  = type;
    ev.code  = code;
    ev.value = value;
    ssize_t n = ::write(uinput_fd_, &ev, sizeof(ev));
    if (n != static_cast<ssize_t>(sizeof(ev))) {
        LP_LOG(DEBUG, "Input: uinput write failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

} // namespace lp::host
