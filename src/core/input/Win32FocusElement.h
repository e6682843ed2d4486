#pragma once

#include <Windows.h>
#include <string>

#include "core/input/FocusElement.h"

namespace wndtap {
namespace core {
namespace input {

// IFocusElement over a native control. Logical focus activates the
// top-level window that owns the control; keyboard focus goes to the
// control itself.
class Win32FocusElement : public IFocusElement {
public:
    Win32FocusElement(HWND hwnd, dispatch::UiDispatcher& dispatcher);
    ~Win32FocusElement() override = default;

    dispatch::UiDispatcher& GetDispatcher() override;
    bool Focus() override;
    bool FocusKeyboard() override;
    std::string GetName() const override;

    HWND GetHWND() const;

private:
    HWND                    m_hwnd = nullptr;
    dispatch::UiDispatcher& m_dispatcher;
};

} // namespace input
} // namespace core
} // namespace wndtap
