#pragma once

#include <Windows.h>
#include <string>

namespace wndtap {
namespace utils {

// UTF-16 -> UTF-8 for logging. Returns an empty string on failure.
std::string WideToUtf8(const std::wstring& wide);

// "Error code N: <system message>"
std::string FormatWin32Error(DWORD code);

} // namespace utils
} // namespace wndtap
