#include "WindowObserver.h"
#include "WindowMessages.h"
#include "utils/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace wndtap {
namespace core {
namespace window {

// ===================================================================
// Construction / Destruction
// ===================================================================

WindowObserver::WindowObserver(IObservableWindow* observedWindow) {
    if (!observedWindow) {
        WNDTAP_LOG_ERROR("WindowObserver constructed with null window");
        throw std::invalid_argument("observedWindow must not be null");
    }

    m_observedWindow = observedWindow;

    if (!m_observedWindow->IsLoaded()) {
        m_loadedSubscription = m_observedWindow->SubscribeLoaded(
            [this](IObservableWindow& window) { OnWindowLoaded(window); });
        WNDTAP_LOG_DEBUG("WindowObserver waiting for '{}' to load",
                         m_observedWindow->GetTitle());
    } else {
        HookIn();
    }
}

WindowObserver::~WindowObserver() {
    // The window outlives us; make sure it never calls back into a
    // destroyed observer.
    if (m_loadedSubscription != 0) {
        m_observedWindow->UnsubscribeLoaded(m_loadedSubscription);
        m_loadedSubscription = 0;
    }
    if (m_hookId != 0) {
        m_observedWindow->RemoveMessageHook(m_hookId);
        m_hookId = 0;
    }
}

// ===================================================================
// State
// ===================================================================

bool WindowObserver::IsAttached() const {
    return m_attached;
}

IObservableWindow& WindowObserver::GetObservedWindow() const {
    return *m_observedWindow;
}

// ===================================================================
// Attach
// ===================================================================

void WindowObserver::OnWindowLoaded(IObservableWindow& window) {
    window.UnsubscribeLoaded(m_loadedSubscription);
    m_loadedSubscription = 0;

    HookIn();
}

void WindowObserver::HookIn() {
    if (m_attached) {
        return;
    }

    m_hookId = m_observedWindow->AddMessageHook(
        [this](const NativeMessage& msg, bool& handled) {
            return WindowProc(msg, handled);
        });
    m_attached = true;

    WNDTAP_LOG_INFO("WindowObserver attached to '{}' (HWND=0x{:X})",
                    m_observedWindow->GetTitle(),
                    reinterpret_cast<uintptr_t>(m_observedWindow->GetNativeHandle()));
}

// ===================================================================
// Hook
// ===================================================================

intptr_t WindowObserver::WindowProc(const NativeMessage& msg, bool& /*handled*/) {
    const char* name = GetMessageName(msg.id);
    WNDTAP_LOG_TRACE("Dispatching {} (0x{:04X})", name ? name : "message", msg.id);

    const NotifyEvent e(m_observedWindow, msg.id);
    NotifyMessage(e);
    NotifyCallbacks(msg.id);

    return 0;
}

// ===================================================================
// Catch-all Message event
// ===================================================================

SubscriptionId WindowObserver::SubscribeMessage(MessageHandler handler) {
    if (!handler) {
        WNDTAP_LOG_ERROR("SubscribeMessage called with empty handler");
        throw std::invalid_argument("handler must not be empty");
    }

    SubscriptionId id = m_nextSubscriptionId++;
    m_messageHandlers.push_back({id, std::move(handler)});
    return id;
}

bool WindowObserver::UnsubscribeMessage(SubscriptionId id) {
    auto it = std::find_if(m_messageHandlers.begin(), m_messageHandlers.end(),
                           [id](const MessageSubscription& s) { return s.id == id; });
    if (it == m_messageHandlers.end()) {
        return false;
    }
    m_messageHandlers.erase(it);
    return true;
}

void WindowObserver::NotifyMessage(const NotifyEvent& e) {
    if (m_messageHandlers.empty()) {
        return;
    }

    // Snapshot: subscribers may (un)subscribe while being notified
    const std::vector<MessageSubscription> handlers = m_messageHandlers;
    for (const auto& s : handlers) {
        s.handler(*this, e);
    }
}

// ===================================================================
// Callback Registry
// ===================================================================

void WindowObserver::AddCallback(NotifyCallbackRef callback) {
    AddCallbackFor(std::nullopt, std::move(callback));
}

void WindowObserver::AddCallbackFor(std::optional<MessageId> messageId,
                                    NotifyCallbackRef callback) {
    if (!callback || !*callback) {
        WNDTAP_LOG_ERROR("AddCallbackFor called with null callback");
        throw std::invalid_argument("callback must not be null");
    }

    m_callbacks.push_back({messageId, std::move(callback)});

    if (messageId) {
        WNDTAP_LOG_DEBUG("Callback registered for 0x{:04X} ({} total)",
                         *messageId, m_callbacks.size());
    } else {
        WNDTAP_LOG_DEBUG("Callback registered for all messages ({} total)",
                         m_callbacks.size());
    }
}

void WindowObserver::NotifyCallbacks(MessageId msg) {
    // Index loop: a callback may add or remove entries while we iterate
    for (size_t i = 0; i < m_callbacks.size(); ++i) {
        if (!m_callbacks[i].listenMessageId ||
            *m_callbacks[i].listenMessageId == msg) {
            NotifyCallbackRef action = m_callbacks[i].action;
            (*action)(NotifyEvent(m_observedWindow, msg));
        }
    }
}

void WindowObserver::RemoveCallback(const NotifyCallbackRef& callback) {
    if (!callback) {
        WNDTAP_LOG_ERROR("RemoveCallback called with null callback");
        throw std::invalid_argument("callback must not be null");
    }

    const size_t before = m_callbacks.size();
    m_callbacks.erase(
        std::remove_if(m_callbacks.begin(), m_callbacks.end(),
                       [&callback](const CallbackEntry& c) { return c.action == callback; }),
        m_callbacks.end());

    WNDTAP_LOG_DEBUG("RemoveCallback removed {} entries", before - m_callbacks.size());
}

void WindowObserver::RemoveCallbacksFor(MessageId messageId) {
    const size_t before = m_callbacks.size();
    m_callbacks.erase(
        std::remove_if(m_callbacks.begin(), m_callbacks.end(),
                       [messageId](const CallbackEntry& c) {
                           return c.listenMessageId && *c.listenMessageId == messageId;
                       }),
        m_callbacks.end());

    WNDTAP_LOG_DEBUG("RemoveCallbacksFor(0x{:04X}) removed {} entries",
                     messageId, before - m_callbacks.size());
}

void WindowObserver::ClearCallbacks() {
    m_callbacks.clear();
    WNDTAP_LOG_DEBUG("Callbacks cleared");
}

size_t WindowObserver::GetCallbackCount() const {
    return m_callbacks.size();
}

} // namespace window
} // namespace core
} // namespace wndtap
