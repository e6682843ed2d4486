#include "utils/Logger.h"
#include "core/dispatch/UiDispatcher.h"
#include "core/input/ControlFocus.h"
#include "core/input/Win32FocusElement.h"
#include "core/window/HostWindow.h"
#include "core/window/WindowMessages.h"
#include "core/window/WindowObserver.h"
#include "core/window/WindowTypes.h"

#include <Windows.h>
#include <exception>

using namespace wndtap::core::dispatch;
using namespace wndtap::core::input;
using namespace wndtap::core::window;
using namespace wndtap::utils;

// ===================================================================
// Main Entry Point
// ===================================================================

int WINAPI wWinMain(HINSTANCE /*hInstance*/, HINSTANCE /*hPrevInstance*/,
                    LPWSTR /*lpCmdLine*/, int /*nCmdShow*/) {

    // ---------------------------------------------------------------
    // Step 1: Initialize Logger
    // ---------------------------------------------------------------
    if (!Logger::Initialize("WndTap", "logs")) {
        MessageBoxW(nullptr, L"Failed to initialize logger", L"WndTap Error", MB_OK);
        return 1;
    }

    WNDTAP_LOG_INFO("=== WndTap demo starting ===");

    int exitCode = 0;
    try {
        UiDispatcher dispatcher;

        // -----------------------------------------------------------
        // Step 2: Create the window and observe it before it loads
        // -----------------------------------------------------------
        WindowConfig winCfg;
        winCfg.posX   = CW_USEDEFAULT;
        winCfg.posY   = CW_USEDEFAULT;
        winCfg.width  = 640;
        winCfg.height = 480;
        winCfg.title  = L"WndTap Observer Demo";

        HostWindow window(dispatcher);
        window.SetCloseCallback([&window]() {
            WNDTAP_LOG_INFO("Close requested");
            DestroyWindow(window.GetHWND());
        });

        WindowObserver observer(&window);

        observer.SubscribeMessage([](WindowObserver& /*sender*/, const NotifyEvent& e) {
            const char* name = GetMessageName(e.messageId);
            if (name) {
                WNDTAP_LOG_TRACE("Message {}", name);
            }
        });

        auto onTitleDoubleClick = MakeNotifyCallback([](const NotifyEvent& e) {
            WNDTAP_LOG_INFO("Title bar double-clicked on '{}'", e.window->GetTitle());
        });
        auto onFocusChange = MakeNotifyCallback([](const NotifyEvent& e) {
            WNDTAP_LOG_INFO("{} on '{}'", GetMessageName(e.messageId), e.window->GetTitle());
        });

        observer.AddCallbackFor(messages::NcLButtonDblClk, onTitleDoubleClick);
        observer.AddCallbackFor(messages::SetFocus, onFocusChange);
        observer.AddCallbackFor(messages::KillFocus, onFocusChange);

        if (!window.Initialize(winCfg)) {
            WNDTAP_LOG_CRITICAL("Failed to initialize window");
            Logger::Shutdown();
            return 1;
        }

        WNDTAP_LOG_INFO("Observer attached: {}", observer.IsAttached());

        // -----------------------------------------------------------
        // Step 3: Move focus once the window has been laid out
        // -----------------------------------------------------------
        Win32FocusElement focusTarget(window.GetHWND(), dispatcher);
        ControlFocus::GiveFocus(&focusTarget, []() {
            WNDTAP_LOG_INFO("Window about to take focus");
        });

        // -----------------------------------------------------------
        // Step 4: Message loop
        // -----------------------------------------------------------
        WNDTAP_LOG_INFO("Entering message loop");
        exitCode = window.Run();

        observer.ClearCallbacks();
        window.Shutdown();

    } catch (const std::exception& ex) {
        WNDTAP_LOG_CRITICAL("Unhandled exception: {}", ex.what());
        exitCode = 1;
    }

    WNDTAP_LOG_INFO("=== WndTap demo shutdown complete ===");
    Logger::Shutdown();

    return exitCode;
}
