#pragma once

#include "core/window/ObservableWindow.h"
#include "core/window/WindowTypes.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace wndtap {
namespace core {
namespace window {

// WindowObserver taps the native message stream of one top-level
// window and re-publishes each message, first to the catch-all
// Message subscribers, then to the registered callbacks whose filter
// matches, in registration order.
//
// The observer is strictly observational: its hook always returns 0
// and never marks a message handled.
//
// If the window is not loaded yet, hooking is deferred to the window's
// loaded notification and happens exactly once. There is no public
// detach; the hook lives as long as the window (or this object, which
// removes it on destruction).
//
// Thread safety: none. Construction, registration and dispatch all
// happen on the UI thread that owns the window. Dispatch is reentrant:
// a callback that causes another message to be sent sees a nested
// dispatch through the same path.
//
// Usage:
//   WindowObserver observer(&mainWindow);
//   auto onDblClick = MakeNotifyCallback([](const NotifyEvent& e) { ... });
//   observer.AddCallbackFor(messages::NcLButtonDblClk, onDblClick);

class WindowObserver {
public:
    // Throws std::invalid_argument if observedWindow is null.
    explicit WindowObserver(IObservableWindow* observedWindow);
    ~WindowObserver();

    // Non-copyable, non-movable: the installed hook captures this
    WindowObserver(const WindowObserver&) = delete;
    WindowObserver& operator=(const WindowObserver&) = delete;
    WindowObserver(WindowObserver&&) = delete;
    WindowObserver& operator=(WindowObserver&&) = delete;

    // --- State ---
    bool IsAttached() const;
    IObservableWindow& GetObservedWindow() const;

    // --- Catch-all Message event ---

    // Subscribers see every message, regardless of registered callbacks.
    // Throws std::invalid_argument on an empty handler.
    SubscriptionId SubscribeMessage(MessageHandler handler);
    bool UnsubscribeMessage(SubscriptionId id);

    // --- Callback Registry ---

    // Same as AddCallbackFor(std::nullopt, callback).
    void AddCallback(NotifyCallbackRef callback);

    // messageId == std::nullopt forwards every message to the callback.
    // Throws std::invalid_argument if callback is null or empty.
    void AddCallbackFor(std::optional<MessageId> messageId, NotifyCallbackRef callback);

    // Removes every entry holding this callback, whatever its filter.
    // Throws std::invalid_argument if callback is null.
    void RemoveCallback(const NotifyCallbackRef& callback);

    // Removes entries registered for exactly this id. Catch-all
    // entries are kept.
    void RemoveCallbacksFor(MessageId messageId);

    void ClearCallbacks();

    size_t GetCallbackCount() const;

    // --- Hook ---

    // Installed on the observed window. Always returns 0 and leaves
    // handled untouched.
    intptr_t WindowProc(const NativeMessage& msg, bool& handled);

private:
    struct CallbackEntry {
        std::optional<MessageId> listenMessageId;
        NotifyCallbackRef        action;
    };

    struct MessageSubscription {
        SubscriptionId id = 0;
        MessageHandler handler;
    };

    void OnWindowLoaded(IObservableWindow& window);
    void HookIn();

    void NotifyMessage(const NotifyEvent& e);
    void NotifyCallbacks(MessageId msg);

    IObservableWindow* m_observedWindow = nullptr;

    std::vector<CallbackEntry>       m_callbacks;
    std::vector<MessageSubscription> m_messageHandlers;
    SubscriptionId                   m_nextSubscriptionId = 1;

    SubscriptionId m_loadedSubscription = 0;
    SubscriptionId m_hookId             = 0;
    bool           m_attached           = false;
};

} // namespace window
} // namespace core
} // namespace wndtap
