#pragma once

#include "core/window/WindowTypes.h"
#include <string>

namespace wndtap {
namespace core {
namespace window {

// ------------------------------------------------------------------
// IObservableWindow -- what a windowing layer must expose so that a
// WindowObserver can tap its native message stream.
//
// The observer never owns the window. It needs:
//   1. a loaded query plus a "became loaded" notification
//   2. the native handle once realized
//   3. an interception point on the native window procedure
//
// Thread Safety:
//   All methods are called from the UI thread that owns the window.
// ------------------------------------------------------------------

class IObservableWindow {
public:
    virtual ~IObservableWindow() = default;

    // --- Realization ---

    // True once the native window exists and has been shown.
    virtual bool IsLoaded() const = 0;

    // Handlers run once, when the window finishes loading. A handler
    // may unsubscribe itself while it runs.
    virtual SubscriptionId SubscribeLoaded(LoadedHandler handler) = 0;
    virtual bool UnsubscribeLoaded(SubscriptionId id) = 0;

    // Null until the window is realized.
    virtual NativeHandle GetNativeHandle() const = 0;

    // --- Message Interception ---

    // Hooks run in installation order, before the window's own
    // handling, for every message delivered to the window.
    virtual SubscriptionId AddMessageHook(MessageHook hook) = 0;
    virtual bool RemoveMessageHook(SubscriptionId id) = 0;

    // --- Debug ---
    virtual std::string GetTitle() const = 0;
};

} // namespace window
} // namespace core
} // namespace wndtap
