#include "Win32Util.h"

namespace wndtap {
namespace utils {

std::string WideToUtf8(const std::wstring& wide) {
    if (wide.empty()) {
        return {};
    }

    int narrowLen = WideCharToMultiByte(CP_UTF8, 0, wide.c_str(), static_cast<int>(wide.size()),
                                        nullptr, 0, nullptr, nullptr);
    if (narrowLen <= 0) {
        return {};
    }

    std::string narrow(static_cast<size_t>(narrowLen), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide.c_str(), static_cast<int>(wide.size()),
                        narrow.data(), narrowLen, nullptr, nullptr);
    return narrow;
}

std::string FormatWin32Error(DWORD code) {
    if (code == 0) {
        return "Success (0)";
    }

    LPWSTR buffer = nullptr;
    DWORD len = FormatMessageW(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
        FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr,
        code,
        MAKELANGID(LANG_ENGLISH, SUBLANG_ENGLISH_US),
        reinterpret_cast<LPWSTR>(&buffer),
        0,
        nullptr
    );

    std::string result = "Error code " + std::to_string(code);
    if (buffer && len > 0) {
        std::string narrow = WideToUtf8(std::wstring(buffer, len));
        while (!narrow.empty() && (narrow.back() == '\n' || narrow.back() == '\r')) {
            narrow.pop_back();
        }
        if (!narrow.empty()) {
            result += ": " + narrow;
        }
    }
    if (buffer) {
        LocalFree(buffer);
    }

    return result;
}

} // namespace utils
} // namespace wndtap
