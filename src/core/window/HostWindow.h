#pragma once

#include <Windows.h>
#include <atomic>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "ObservableWindow.h"
#include "WindowTypes.h"

namespace wndtap {
namespace core {
namespace dispatch {
class UiDispatcher;
}

namespace window {

// Top-level Win32 window that can be observed.
//
// Installed message hooks see every message before the window's own
// handling. The bound UiDispatcher is drained by the message loop
// (ProcessMessages / Run), never from inside the window procedure.
// An exception thrown by a hook or callback inside the window procedure
// is held and rethrown by the next ProcessMessages / Run step.
class HostWindow : public IObservableWindow {
public:
    explicit HostWindow(dispatch::UiDispatcher& dispatcher);
    ~HostWindow() override;

    // Non-copyable
    HostWindow(const HostWindow&) = delete;
    HostWindow& operator=(const HostWindow&) = delete;

    // ----- Lifecycle -----
    // Creates and shows the window, then fires the loaded handlers.
    bool Initialize(const WindowConfig& config);
    void Shutdown();
    bool IsInitialized() const;

    // ----- Message Pump -----
    // Non-blocking. Returns false when WM_QUIT is received.
    // Rethrows an exception held from the window procedure.
    bool ProcessMessages();

    // Blocking loop until WM_QUIT. Returns the quit exit code.
    int Run();

    // ----- IObservableWindow -----
    bool IsLoaded() const override;
    SubscriptionId SubscribeLoaded(LoadedHandler handler) override;
    bool UnsubscribeLoaded(SubscriptionId id) override;
    NativeHandle GetNativeHandle() const override;
    SubscriptionId AddMessageHook(MessageHook hook) override;
    bool RemoveMessageHook(SubscriptionId id) override;
    std::string GetTitle() const override;

    // ----- Native Handle -----
    HWND GetHWND() const;

    // ----- Callbacks -----
    void SetResizeCallback(ResizeCallback cb);
    void SetCloseCallback(CloseCallback cb);

private:
    struct HookEntry {
        SubscriptionId               id = 0;
        std::shared_ptr<MessageHook> hook;
    };

    struct LoadedEntry {
        SubscriptionId id = 0;
        LoadedHandler  handler;
    };

    // Win32 window proc routing
    static LRESULT CALLBACK StaticWndProc(HWND hwnd, UINT msg,
                                          WPARAM wp, LPARAM lp);
    LRESULT InstanceWndProc(UINT msg, WPARAM wp, LPARAM lp);

    // Returns true if a hook handled the message.
    bool RunHooks(UINT msg, WPARAM wp, LPARAM lp, LRESULT& result);

    bool RegisterWndClass();
    bool CreateHWND(const WindowConfig& cfg);
    void FireLoaded();
    void DrainDispatcher();

    // Called from a catch block inside the window procedure.
    void HoldCurrentException(UINT msg);
    void RethrowHeldException();

    // ----- Win32 Handles -----
    HWND      m_hwnd      = nullptr;
    HINSTANCE m_hinstance = nullptr;

    // ----- State -----
    std::wstring m_title;
    int          m_width       = 0;
    int          m_height      = 0;
    bool         m_loaded      = false;
    bool         m_initialized = false;
    bool         m_quitOnDestroy = true;

    dispatch::UiDispatcher& m_dispatcher;

    // ----- Hooks & Handlers -----
    std::vector<HookEntry>   m_hooks;
    std::vector<LoadedEntry> m_loadedHandlers;
    SubscriptionId           m_nextId = 1;

    // ----- Callbacks -----
    ResizeCallback m_resizeCallback;
    CloseCallback  m_closeCallback;

    // First exception caught in the window procedure, not yet rethrown
    std::exception_ptr m_heldException;

    // Posted to wake a blocked GetMessage loop when work is queued
    static constexpr UINT WM_WNDTAP_WAKEUP = WM_APP + 0x54;

    // ----- Class Registration -----
    static constexpr const wchar_t* WND_CLASS = L"WndTap_HostWindow_Class";
    static std::atomic<bool> s_classRegistered;
};

} // namespace window
} // namespace core
} // namespace wndtap
