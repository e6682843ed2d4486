#include "HostWindow.h"
#include "core/dispatch/UiDispatcher.h"
#include "utils/Logger.h"
#include "utils/Win32Util.h"

#include <Windows.h>
#include <algorithm>

namespace wndtap {
namespace core {
namespace window {

// Static member init
std::atomic<bool> HostWindow::s_classRegistered{false};

// ===================================================================
// Construction / Destruction
// ===================================================================

HostWindow::HostWindow(dispatch::UiDispatcher& dispatcher)
    : m_dispatcher(dispatcher) {
}

HostWindow::~HostWindow() {
    Shutdown();
}

// ===================================================================
// Lifecycle
// ===================================================================

bool HostWindow::Initialize(const WindowConfig& cfg) {
    if (m_initialized) {
        WNDTAP_LOG_WARN("HostWindow::Initialize called on already-initialized window");
        return true;
    }

    WNDTAP_LOG_INFO("Initializing HostWindow ({}x{} at {},{})",
                    cfg.width, cfg.height, cfg.posX, cfg.posY);

    m_hinstance = GetModuleHandleW(nullptr);
    if (!m_hinstance) {
        WNDTAP_LOG_CRITICAL("GetModuleHandle failed: {}",
                            utils::FormatWin32Error(GetLastError()));
        return false;
    }

    if (!RegisterWndClass()) {
        return false;
    }

    m_title  = cfg.title;
    m_width  = cfg.width;
    m_height = cfg.height;
    m_quitOnDestroy = cfg.quitOnDestroy;

    if (!CreateHWND(cfg)) {
        return false;
    }

    HWND hwnd = m_hwnd;
    m_dispatcher.SetWakeupCallback([hwnd]() {
        PostMessageW(hwnd, WM_WNDTAP_WAKEUP, 0, 0);
    });

    if (cfg.visible) {
        ShowWindow(m_hwnd, SW_SHOWNORMAL);
        UpdateWindow(m_hwnd);
    }

    m_initialized = true;
    WNDTAP_LOG_INFO("HostWindow initialized successfully (HWND=0x{:X})",
                    reinterpret_cast<uintptr_t>(m_hwnd));

    FireLoaded();
    return true;
}

void HostWindow::Shutdown() {
    if (!m_initialized) {
        return;
    }

    WNDTAP_LOG_INFO("HostWindow shutting down");

    m_dispatcher.SetWakeupCallback(nullptr);

    if (m_hwnd) {
        DestroyWindow(m_hwnd);
        m_hwnd = nullptr;
    }

    m_hooks.clear();
    m_loadedHandlers.clear();
    m_loaded      = false;
    m_initialized = false;
}

bool HostWindow::IsInitialized() const {
    return m_initialized;
}

// ===================================================================
// Message Pump
// ===================================================================

bool HostWindow::ProcessMessages() {
    RethrowHeldException();

    MSG msg{};
    while (PeekMessageW(&msg, nullptr, 0, 0, PM_REMOVE)) {
        if (msg.message == WM_QUIT) {
            WNDTAP_LOG_INFO("WM_QUIT received, exiting message loop");
            return false;
        }
        TranslateMessage(&msg);
        DispatchMessageW(&msg);
        RethrowHeldException();
    }
    DrainDispatcher();
    return true;
}

int HostWindow::Run() {
    RethrowHeldException();
    DrainDispatcher();

    MSG msg{};
    for (;;) {
        BOOL ret = GetMessageW(&msg, nullptr, 0, 0);
        if (ret == 0) {
            WNDTAP_LOG_INFO("WM_QUIT received, exiting message loop");
            return static_cast<int>(msg.wParam);
        }
        if (ret == -1) {
            WNDTAP_LOG_CRITICAL("GetMessageW failed: {}",
                                utils::FormatWin32Error(GetLastError()));
            return -1;
        }
        TranslateMessage(&msg);
        DispatchMessageW(&msg);
        RethrowHeldException();
        DrainDispatcher();
    }
}

void HostWindow::DrainDispatcher() {
    size_t ran = m_dispatcher.ProcessPending();
    if (ran > 0) {
        WNDTAP_LOG_TRACE("Dispatcher ran {} work items", ran);
    }
}

void HostWindow::HoldCurrentException(UINT msg) {
    if (m_heldException) {
        WNDTAP_LOG_ERROR("Dropping second exception raised while handling 0x{:04X} "
                         "(one is already pending)", msg);
        return;
    }
    WNDTAP_LOG_DEBUG("Exception raised while handling 0x{:04X}, deferred to the message loop",
                     msg);
    m_heldException = std::current_exception();
}

void HostWindow::RethrowHeldException() {
    if (m_heldException) {
        std::exception_ptr ex = std::move(m_heldException);
        m_heldException = nullptr;
        std::rethrow_exception(ex);
    }
}

// ===================================================================
// IObservableWindow
// ===================================================================

bool HostWindow::IsLoaded() const {
    return m_loaded;
}

SubscriptionId HostWindow::SubscribeLoaded(LoadedHandler handler) {
    SubscriptionId id = m_nextId++;
    m_loadedHandlers.push_back({id, std::move(handler)});
    return id;
}

bool HostWindow::UnsubscribeLoaded(SubscriptionId id) {
    auto it = std::find_if(m_loadedHandlers.begin(), m_loadedHandlers.end(),
                           [id](const LoadedEntry& e) { return e.id == id; });
    if (it == m_loadedHandlers.end()) {
        return false;
    }
    m_loadedHandlers.erase(it);
    return true;
}

NativeHandle HostWindow::GetNativeHandle() const {
    return m_hwnd;
}

SubscriptionId HostWindow::AddMessageHook(MessageHook hook) {
    SubscriptionId id = m_nextId++;
    m_hooks.push_back({id, std::make_shared<MessageHook>(std::move(hook))});
    WNDTAP_LOG_DEBUG("Message hook {} installed ({} total)", id, m_hooks.size());
    return id;
}

bool HostWindow::RemoveMessageHook(SubscriptionId id) {
    auto it = std::find_if(m_hooks.begin(), m_hooks.end(),
                           [id](const HookEntry& e) { return e.id == id; });
    if (it == m_hooks.end()) {
        return false;
    }
    m_hooks.erase(it);
    WNDTAP_LOG_DEBUG("Message hook {} removed", id);
    return true;
}

std::string HostWindow::GetTitle() const {
    return utils::WideToUtf8(m_title);
}

void HostWindow::FireLoaded() {
    m_loaded = true;

    // Handlers may unsubscribe themselves (or others) while we iterate
    const std::vector<LoadedEntry> handlers = m_loadedHandlers;
    for (const auto& entry : handlers) {
        bool stillSubscribed = std::any_of(
            m_loadedHandlers.begin(), m_loadedHandlers.end(),
            [&entry](const LoadedEntry& e) { return e.id == entry.id; });
        if (stillSubscribed && entry.handler) {
            entry.handler(*this);
        }
    }
}

// ===================================================================
// Native Handle
// ===================================================================

HWND HostWindow::GetHWND() const {
    return m_hwnd;
}

// ===================================================================
// Callbacks
// ===================================================================

void HostWindow::SetResizeCallback(ResizeCallback cb) {
    m_resizeCallback = std::move(cb);
}

void HostWindow::SetCloseCallback(CloseCallback cb) {
    m_closeCallback = std::move(cb);
}

// ===================================================================
// Static Window Procedure (routes to instance)
// ===================================================================

LRESULT CALLBACK HostWindow::StaticWndProc(HWND hwnd, UINT msg,
                                           WPARAM wp, LPARAM lp) {
    HostWindow* self = nullptr;

    if (msg == WM_NCCREATE) {
        auto* cs = reinterpret_cast<CREATESTRUCTW*>(lp);
        self = static_cast<HostWindow*>(cs->lpCreateParams);
        SetWindowLongPtrW(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(self));
        self->m_hwnd = hwnd;
    } else {
        self = reinterpret_cast<HostWindow*>(
            GetWindowLongPtrW(hwnd, GWLP_USERDATA));
    }

    if (self) {
        return self->InstanceWndProc(msg, wp, lp);
    }

    return DefWindowProcW(hwnd, msg, wp, lp);
}

// ===================================================================
// Instance Window Procedure
// ===================================================================

bool HostWindow::RunHooks(UINT msg, WPARAM wp, LPARAM lp, LRESULT& result) {
    if (m_hooks.empty()) {
        return false;
    }

    NativeMessage native;
    native.handle = m_hwnd;
    native.id     = static_cast<MessageId>(msg);
    native.wParam = static_cast<uintptr_t>(wp);
    native.lParam = static_cast<intptr_t>(lp);

    // Snapshot: a hook may install or remove hooks, or re-enter us
    const std::vector<HookEntry> hooks = m_hooks;
    for (const auto& entry : hooks) {
        // Skip hooks removed by an earlier hook; their owner may be gone
        bool stillInstalled = std::any_of(
            m_hooks.begin(), m_hooks.end(),
            [&entry](const HookEntry& e) { return e.id == entry.id; });
        if (!stillInstalled) {
            continue;
        }

        bool handled = false;
        intptr_t hookResult = (*entry.hook)(native, handled);
        if (handled) {
            result = static_cast<LRESULT>(hookResult);
            return true;
        }
    }
    return false;
}

LRESULT HostWindow::InstanceWndProc(UINT msg, WPARAM wp, LPARAM lp) {
    // Exceptions must not unwind through user32. A throwing hook counts
    // as not handled, so default processing (and WM_NCDESTROY cleanup)
    // still happens.
    LRESULT hookResult = 0;
    try {
        if (RunHooks(msg, wp, lp, hookResult)) {
            return hookResult;
        }
    } catch (...) {
        HoldCurrentException(msg);
    }

    switch (msg) {

    case WM_WNDTAP_WAKEUP:
        // Work is drained by the message loop once we return
        return 0;

    case WM_SIZE: {
        int newW = LOWORD(lp);
        int newH = HIWORD(lp);
        if (newW > 0 && newH > 0 && (newW != m_width || newH != m_height)) {
            m_width  = newW;
            m_height = newH;
            WNDTAP_LOG_DEBUG("Window resized to {}x{}", newW, newH);
            if (m_resizeCallback) {
                try {
                    m_resizeCallback(newW, newH);
                } catch (...) {
                    HoldCurrentException(msg);
                }
            }
        }
        return 0;
    }

    case WM_CLOSE: {
        WNDTAP_LOG_INFO("WM_CLOSE received");
        if (m_closeCallback) {
            try {
                m_closeCallback();
            } catch (...) {
                HoldCurrentException(msg);
            }
            return 0;
        }
        break;
    }

    case WM_DESTROY: {
        WNDTAP_LOG_INFO("WM_DESTROY received");
        if (m_quitOnDestroy) {
            PostQuitMessage(0);
        }
        return 0;
    }

    case WM_NCDESTROY: {
        // Hooks die with the native window
        m_hooks.clear();
        m_loaded = false;
        HWND hwnd = m_hwnd;
        m_hwnd = nullptr;
        SetWindowLongPtrW(hwnd, GWLP_USERDATA, 0);
        return DefWindowProcW(hwnd, msg, wp, lp);
    }

    default:
        break;
    }

    return DefWindowProcW(m_hwnd, msg, wp, lp);
}

// ===================================================================
// Internal: Register Window Class
// ===================================================================

bool HostWindow::RegisterWndClass() {
    if (s_classRegistered.load()) {
        return true;
    }

    WNDCLASSEXW wc{};
    wc.cbSize        = sizeof(WNDCLASSEXW);
    wc.style         = CS_HREDRAW | CS_VREDRAW | CS_DBLCLKS;
    wc.lpfnWndProc   = StaticWndProc;
    wc.cbClsExtra    = 0;
    wc.cbWndExtra    = 0;
    wc.hInstance     = m_hinstance;
    wc.hIcon         = LoadIconW(nullptr, IDI_APPLICATION);
    wc.hCursor       = LoadCursorW(nullptr, IDC_ARROW);
    wc.hbrBackground = reinterpret_cast<HBRUSH>(COLOR_WINDOW + 1);
    wc.lpszMenuName  = nullptr;
    wc.lpszClassName = WND_CLASS;
    wc.hIconSm       = nullptr;

    if (!RegisterClassExW(&wc)) {
        DWORD err = GetLastError();
        if (err == ERROR_CLASS_ALREADY_EXISTS) {
            s_classRegistered.store(true);
            return true;
        }
        WNDTAP_LOG_CRITICAL("RegisterClassExW failed: {}", utils::FormatWin32Error(err));
        return false;
    }

    s_classRegistered.store(true);
    WNDTAP_LOG_DEBUG("Window class '{}' registered", "WndTap_HostWindow_Class");
    return true;
}

// ===================================================================
// Internal: Create HWND
// ===================================================================

bool HostWindow::CreateHWND(const WindowConfig& cfg) {
    HWND hwnd = CreateWindowExW(
        0,
        WND_CLASS,
        cfg.title.c_str(),
        WS_OVERLAPPEDWINDOW,
        cfg.posX, cfg.posY,
        cfg.width, cfg.height,
        nullptr,   // no parent
        nullptr,   // no menu
        m_hinstance,
        this       // pass this pointer for WM_NCCREATE
    );

    if (!hwnd) {
        WNDTAP_LOG_CRITICAL("CreateWindowExW failed: {}",
                            utils::FormatWin32Error(GetLastError()));
        m_hwnd = nullptr;
        return false;
    }

    // m_hwnd is set in StaticWndProc during WM_NCCREATE
    WNDTAP_LOG_DEBUG("HWND created: 0x{:X}", reinterpret_cast<uintptr_t>(hwnd));
    return true;
}

} // namespace window
} // namespace core
} // namespace wndtap
