#include "Win32FocusElement.h"
#include "core/dispatch/UiDispatcher.h"
#include "utils/Logger.h"
#include "utils/Win32Util.h"

#include <iterator>

namespace wndtap {
namespace core {
namespace input {

Win32FocusElement::Win32FocusElement(HWND hwnd, dispatch::UiDispatcher& dispatcher)
    : m_hwnd(hwnd)
    , m_dispatcher(dispatcher) {
}

dispatch::UiDispatcher& Win32FocusElement::GetDispatcher() {
    return m_dispatcher;
}

bool Win32FocusElement::Focus() {
    if (!IsWindow(m_hwnd)) {
        WNDTAP_LOG_WARN("Focus: HWND=0x{:X} is no longer a window",
                        reinterpret_cast<uintptr_t>(m_hwnd));
        return false;
    }

    HWND root = GetAncestor(m_hwnd, GA_ROOT);
    if (!root) {
        root = m_hwnd;
    }

    if (GetActiveWindow() == root) {
        return true;
    }

    // SetActiveWindow returns the previously active window, which may
    // legitimately be null; the call failed only if GetLastError is set.
    SetLastError(ERROR_SUCCESS);
    if (!SetActiveWindow(root)) {
        DWORD err = GetLastError();
        if (err != ERROR_SUCCESS) {
            WNDTAP_LOG_WARN("SetActiveWindow failed: {}", utils::FormatWin32Error(err));
            return false;
        }
    }
    return true;
}

bool Win32FocusElement::FocusKeyboard() {
    if (!IsWindow(m_hwnd)) {
        WNDTAP_LOG_WARN("FocusKeyboard: HWND=0x{:X} is no longer a window",
                        reinterpret_cast<uintptr_t>(m_hwnd));
        return false;
    }

    SetLastError(ERROR_SUCCESS);
    if (!SetFocus(m_hwnd)) {
        DWORD err = GetLastError();
        if (err != ERROR_SUCCESS) {
            WNDTAP_LOG_WARN("SetFocus failed: {}", utils::FormatWin32Error(err));
            return false;
        }
    }
    return GetFocus() == m_hwnd;
}

std::string Win32FocusElement::GetName() const {
    if (!IsWindow(m_hwnd)) {
        return "<destroyed>";
    }

    wchar_t text[256] = {};
    int len = GetWindowTextW(m_hwnd, text, static_cast<int>(std::size(text)));
    if (len <= 0) {
        return "<untitled>";
    }
    return utils::WideToUtf8(std::wstring(text, static_cast<size_t>(len)));
}

HWND Win32FocusElement::GetHWND() const {
    return m_hwnd;
}

} // namespace input
} // namespace core
} // namespace wndtap
