#pragma once

#include <cstdint>
#include <string>
#include <functional>
#include <memory>
#include <utility>

namespace wndtap {
namespace core {
namespace window {

class IObservableWindow;
class WindowObserver;

// ------------------------------------------------------------------
// Native message primitives
// ------------------------------------------------------------------

// Win32 message code. Unsigned like UINT, so there are no negative ids;
// any value is a valid filter.
using MessageId = uint32_t;

// Opaque OS window handle (HWND on Windows). Null until realized.
using NativeHandle = void*;

// Token returned by subscribe/add calls. Zero is never handed out.
using SubscriptionId = uint64_t;

struct NativeMessage {
    NativeHandle handle  = nullptr;
    MessageId    id      = 0;
    uintptr_t    wParam  = 0;
    intptr_t     lParam  = 0;
};

// ------------------------------------------------------------------
// Observer notification
// ------------------------------------------------------------------

// Built fresh for every listener invocation. Message parameters are
// deliberately not carried.
struct NotifyEvent {
    IObservableWindow* window    = nullptr;
    MessageId          messageId = 0;

    NotifyEvent() = default;
    NotifyEvent(IObservableWindow* w, MessageId id)
        : window(w), messageId(id) {}

    bool operator==(const NotifyEvent& other) const {
        return window == other.window && messageId == other.messageId;
    }
    bool operator!=(const NotifyEvent& other) const {
        return !(*this == other);
    }
};

// ------------------------------------------------------------------
// Window configuration (HostWindow)
// ------------------------------------------------------------------

struct WindowConfig {
    int          posX    = 100;
    int          posY    = 100;
    int          width   = 640;
    int          height  = 480;
    bool         visible = true;
    // Post WM_QUIT when the window is destroyed (main window behaviour)
    bool         quitOnDestroy = true;
    std::wstring title   = L"WndTap";
};

// ------------------------------------------------------------------
// Callback types
// ------------------------------------------------------------------

// Window-side hook. Runs before the window's own processing; setting
// handled to true makes the window return the hook's result.
using MessageHook    = std::function<intptr_t(const NativeMessage& msg, bool& handled)>;
using LoadedHandler  = std::function<void(IObservableWindow& window)>;

// Observer-side listeners.
using MessageHandler = std::function<void(WindowObserver& sender, const NotifyEvent& e)>;
using NotifyCallback = std::function<void(const NotifyEvent& e)>;

// Registered callbacks are compared by pointer identity, so the same
// callable can be registered under several filters and removed at once.
using NotifyCallbackRef = std::shared_ptr<const NotifyCallback>;

inline NotifyCallbackRef MakeNotifyCallback(NotifyCallback fn) {
    return std::make_shared<const NotifyCallback>(std::move(fn));
}

using ResizeCallback = std::function<void(int width, int height)>;
using CloseCallback  = std::function<void()>;

} // namespace window
} // namespace core
} // namespace wndtap
