///////////////////////////////////////////////////////////////////////////////
// input_injector.cpp -- Control message routing and injector selection
///////////////////////////////////////////////////////////////////////////////

#include "input_injector.h"
#include "linux_input_injector.h"

#include <lp/common.h>

namespace lp::host {

// ---------------------------------------------------------------------------
// dispatchControl / factory
// ---------------------------------------------------------------------------
bool dispatchControl(IInputInjector& injector, const ControlMessage& msg) {
    switch (msg.kind) {
        case ControlKind::MousePacket:
            injector.injectPointer(msg.mouse_type, msg.button_mask, msg.x, msg.y);
            return true;
        case ControlKind::MouseScroll:
            injector.injectScroll(msg.button);
            return true;
        case ControlKind::KeyPress:
            injector.injectKey(msg.key, true);
            return true;
        case ControlKind::KeyRelease:
            injector.injectKey(msg.key, false);
            return true;
        case ControlKind::Net:
        case ControlKind::Goodbye:
            break;
    }
    return false;
}

std::unique_ptr<IInputInjector> createInputInjector(const std::string& kind,
                                                    const std::string& display) {
    if (kind == "none") {
        LP_LOG(INFO, "Input: injection disabled");
        return std::make_unique<NullInputInjector>();
    }
    if (kind != "xdotool") {
        LP_LOG(WARN, "Input: unknown injector '%s', input disabled", kind.c_str());
        return std::make_unique<NullInputInjector>();
    }

    auto injector = std::make_unique<LinuxInputInjector>(display);
    if (!injector->initialize()) {
        LP_LOG(WARN, "Input: xdotool not found, pointer and keyboard input will be dropped");
    }
    return injector;
}

} // namespace lp::host
