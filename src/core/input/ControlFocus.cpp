#include "ControlFocus.h"
#include "core/dispatch/UiDispatcher.h"
#include "utils/Logger.h"

#include <stdexcept>

namespace wndtap {
namespace core {
namespace input {

namespace {

void ApplyFocus(IFocusElement* element) {
    const bool logical  = element->Focus();
    const bool keyboard = element->FocusKeyboard();
    WNDTAP_LOG_DEBUG("Focus applied to '{}' (logical={}, keyboard={})",
                     element->GetName(), logical, keyboard);
}

} // namespace

void ControlFocus::GiveFocus(IFocusElement* element) {
    GiveFocus(element, nullptr);
}

void ControlFocus::GiveFocus(IFocusElement* element, std::function<void()> actionOnFocus) {
    if (!element) {
        WNDTAP_LOG_ERROR("GiveFocus called with null element");
        throw std::invalid_argument("element must not be null");
    }

    element->GetDispatcher().BeginInvoke(
        [element, action = std::move(actionOnFocus)]() {
            if (action) {
                action();
            }
            ApplyFocus(element);
        },
        dispatch::DispatcherPriority::Render);

    WNDTAP_LOG_DEBUG("Focus scheduled for '{}'", element->GetName());
}

} // namespace input
} // namespace core
} // namespace wndtap
