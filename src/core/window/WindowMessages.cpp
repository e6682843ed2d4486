#include "WindowMessages.h"

namespace wndtap {
namespace core {
namespace window {

const char* GetMessageName(MessageId id) {
    switch (id) {
    case messages::Null:              return "WM_NULL";
    case messages::Create:            return "WM_CREATE";
    case messages::Destroy:           return "WM_DESTROY";
    case messages::Move:              return "WM_MOVE";
    case messages::Size:              return "WM_SIZE";
    case messages::Activate:          return "WM_ACTIVATE";
    case messages::SetFocus:          return "WM_SETFOCUS";
    case messages::KillFocus:         return "WM_KILLFOCUS";
    case messages::Enable:            return "WM_ENABLE";
    case messages::SetText:           return "WM_SETTEXT";
    case messages::Paint:             return "WM_PAINT";
    case messages::Close:             return "WM_CLOSE";
    case messages::Quit:              return "WM_QUIT";
    case messages::EraseBkgnd:        return "WM_ERASEBKGND";
    case messages::ShowWindow:        return "WM_SHOWWINDOW";
    case messages::ActivateApp:       return "WM_ACTIVATEAPP";
    case messages::SetCursor:         return "WM_SETCURSOR";
    case messages::MouseActivate:     return "WM_MOUSEACTIVATE";
    case messages::GetMinMaxInfo:     return "WM_GETMINMAXINFO";
    case messages::WindowPosChanging: return "WM_WINDOWPOSCHANGING";
    case messages::WindowPosChanged:  return "WM_WINDOWPOSCHANGED";
    case messages::DisplayChange:     return "WM_DISPLAYCHANGE";
    case messages::GetIcon:           return "WM_GETICON";
    case messages::NcCreate:          return "WM_NCCREATE";
    case messages::NcDestroy:         return "WM_NCDESTROY";
    case messages::NcCalcSize:        return "WM_NCCALCSIZE";
    case messages::NcHitTest:         return "WM_NCHITTEST";
    case messages::NcPaint:           return "WM_NCPAINT";
    case messages::NcActivate:        return "WM_NCACTIVATE";
    case messages::NcMouseMove:       return "WM_NCMOUSEMOVE";
    case messages::NcLButtonDown:     return "WM_NCLBUTTONDOWN";
    case messages::NcLButtonUp:       return "WM_NCLBUTTONUP";
    case messages::NcLButtonDblClk:   return "WM_NCLBUTTONDBLCLK";
    case messages::NcRButtonDown:     return "WM_NCRBUTTONDOWN";
    case messages::NcRButtonUp:       return "WM_NCRBUTTONUP";
    case messages::NcRButtonDblClk:   return "WM_NCRBUTTONDBLCLK";
    case messages::KeyDown:           return "WM_KEYDOWN";
    case messages::KeyUp:             return "WM_KEYUP";
    case messages::Char:              return "WM_CHAR";
    case messages::SysKeyDown:        return "WM_SYSKEYDOWN";
    case messages::SysKeyUp:          return "WM_SYSKEYUP";
    case messages::Command:           return "WM_COMMAND";
    case messages::SysCommand:        return "WM_SYSCOMMAND";
    case messages::Timer:             return "WM_TIMER";
    case messages::MouseMove:         return "WM_MOUSEMOVE";
    case messages::LButtonDown:       return "WM_LBUTTONDOWN";
    case messages::LButtonUp:         return "WM_LBUTTONUP";
    case messages::LButtonDblClk:     return "WM_LBUTTONDBLCLK";
    case messages::RButtonDown:       return "WM_RBUTTONDOWN";
    case messages::RButtonUp:         return "WM_RBUTTONUP";
    case messages::RButtonDblClk:     return "WM_RBUTTONDBLCLK";
    case messages::MButtonDown:       return "WM_MBUTTONDOWN";
    case messages::MButtonUp:         return "WM_MBUTTONUP";
    case messages::MouseWheel:        return "WM_MOUSEWHEEL";
    case messages::EnterSizeMove:     return "WM_ENTERSIZEMOVE";
    case messages::ExitSizeMove:      return "WM_EXITSIZEMOVE";
    case messages::DpiChanged:        return "WM_DPICHANGED";
    case messages::User:              return "WM_USER";
    case messages::App:               return "WM_APP";
    default:
        return nullptr;
    }
}

} // namespace window
} // namespace core
} // namespace wndtap
