#pragma once

#include <string>

namespace wndtap {
namespace core {
namespace dispatch {
class UiDispatcher;
}

namespace input {

// ------------------------------------------------------------------
// IFocusElement -- a UI element that can take focus.
//
// Logical focus is the element's focus within its focus scope (the
// top-level window). Keyboard focus is the element that receives raw
// key input. Both are set on the UI thread returned by GetDispatcher().
// ------------------------------------------------------------------

class IFocusElement {
public:
    virtual ~IFocusElement() = default;

    virtual dispatch::UiDispatcher& GetDispatcher() = 0;

    // Returns true if the element took logical focus.
    virtual bool Focus() = 0;

    // Returns true if the element took keyboard focus.
    virtual bool FocusKeyboard() = 0;

    virtual std::string GetName() const = 0;
};

} // namespace input
} // namespace core
} // namespace wndtap
