#pragma once

#include "core/window/WindowTypes.h"

namespace wndtap {
namespace core {
namespace window {
namespace messages {

// ------------------------------------------------------------------
// Win32 window message codes, usable as observer filters without
// pulling in <Windows.h>. Values match winuser.h.
// ------------------------------------------------------------------

constexpr MessageId Null             = 0x0000;
constexpr MessageId Create           = 0x0001;
constexpr MessageId Destroy          = 0x0002;
constexpr MessageId Move             = 0x0003;
constexpr MessageId Size             = 0x0005;
constexpr MessageId Activate         = 0x0006;
constexpr MessageId SetFocus         = 0x0007;
constexpr MessageId KillFocus        = 0x0008;
constexpr MessageId Enable           = 0x000A;
constexpr MessageId SetText          = 0x000C;
constexpr MessageId Paint            = 0x000F;
constexpr MessageId Close            = 0x0010;
constexpr MessageId Quit             = 0x0012;
constexpr MessageId EraseBkgnd       = 0x0014;
constexpr MessageId ShowWindow       = 0x0018;
constexpr MessageId ActivateApp      = 0x001C;
constexpr MessageId SetCursor        = 0x0020;
constexpr MessageId MouseActivate    = 0x0021;
constexpr MessageId GetMinMaxInfo    = 0x0024;
constexpr MessageId WindowPosChanging = 0x0046;
constexpr MessageId WindowPosChanged = 0x0047;
constexpr MessageId GetIcon          = 0x007F;
constexpr MessageId NcCreate         = 0x0081;
constexpr MessageId NcDestroy        = 0x0082;
constexpr MessageId NcCalcSize       = 0x0083;
constexpr MessageId NcHitTest        = 0x0084;
constexpr MessageId NcPaint          = 0x0085;
constexpr MessageId NcActivate       = 0x0086;
constexpr MessageId NcMouseMove      = 0x00A0;
constexpr MessageId NcLButtonDown    = 0x00A1;
constexpr MessageId NcLButtonUp      = 0x00A2;
constexpr MessageId NcLButtonDblClk  = 0x00A3;
constexpr MessageId NcRButtonDown    = 0x00A4;
constexpr MessageId NcRButtonUp      = 0x00A5;
constexpr MessageId NcRButtonDblClk  = 0x00A6;
constexpr MessageId KeyDown          = 0x0100;
constexpr MessageId KeyUp            = 0x0101;
constexpr MessageId Char             = 0x0102;
constexpr MessageId SysKeyDown       = 0x0104;
constexpr MessageId SysKeyUp         = 0x0105;
constexpr MessageId Command          = 0x0111;
constexpr MessageId SysCommand       = 0x0112;
constexpr MessageId Timer            = 0x0113;
constexpr MessageId MouseMove        = 0x0200;
constexpr MessageId LButtonDown      = 0x0201;
constexpr MessageId LButtonUp        = 0x0202;
constexpr MessageId LButtonDblClk    = 0x0203;
constexpr MessageId RButtonDown      = 0x0204;
constexpr MessageId RButtonUp        = 0x0205;
constexpr MessageId RButtonDblClk    = 0x0206;
constexpr MessageId MButtonDown      = 0x0207;
constexpr MessageId MButtonUp        = 0x0208;
constexpr MessageId MouseWheel       = 0x020A;
constexpr MessageId EnterSizeMove    = 0x0231;
constexpr MessageId ExitSizeMove     = 0x0232;
constexpr MessageId DpiChanged       = 0x02E0;
constexpr MessageId DisplayChange    = 0x007E;
constexpr MessageId User             = 0x0400;
constexpr MessageId App              = 0x8000;

} // namespace messages

// Symbolic name ("WM_SIZE") for a known message code, nullptr otherwise.
const char* GetMessageName(MessageId id);

} // namespace window
} // namespace core
} // namespace wndtap
