#pragma once

#include "core/input/FocusElement.h"

#include <functional>

namespace wndtap {
namespace core {
namespace input {

// ControlFocus moves focus to an element from anywhere on its UI
// thread, including right after it was shown or laid out.
//
// Focus is not applied inline. The work is queued on the element's
// dispatcher at Render priority so the element is fully arranged
// when it runs. The queued work calls, in order:
//   actionOnFocus() (if given), element->Focus(), element->FocusKeyboard()
//
// An exception from actionOnFocus propagates out of the dispatcher
// and the element is not focused.
//
// Usage:
//   ControlFocus::GiveFocus(&searchBox);
//   ControlFocus::GiveFocus(&searchBox, [&] { searchBox.SelectAll(); });

class ControlFocus {
public:
    ControlFocus() = delete;

    // Throws std::invalid_argument if element is null. The element is
    // held by raw pointer and must outlive the queued work.
    static void GiveFocus(IFocusElement* element);
    static void GiveFocus(IFocusElement* element, std::function<void()> actionOnFocus);
};

} // namespace input
} // namespace core
} // namespace wndtap
