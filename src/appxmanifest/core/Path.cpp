#include "appxmanifest/core/Path.hpp"
#include "appxmanifest/utils/Logger.hpp"
#include <algorithm>
#include <cctype>

#ifdef _WIN32
#include <windows.h>
#include <utf8.h>
#else
#include <filesystem>
#endif

namespace appxmanifest {
namespace core {

Path::Path(const std::string& path) : utf8_path_(path) {}

Path::Path(const char* path) : Path(std::string(path ? path : "")) {}

#ifdef _WIN32
std::wstring Path::getWidePath() const {
    if (utf8_path_.empty()) return std::wstring();

    try {
        std::wstring result;
        utf8::utf8to16(utf8_path_.begin(), utf8_path_.end(), std::back_inserter(result));
        return result;
    } catch (const utf8::exception& e) {
        // 非法UTF-8，退回Windows API转换
        int size_needed = MultiByteToWideChar(CP_UTF8, 0, utf8_path_.c_str(), -1, NULL, 0);
        if (size_needed == 0) return std::wstring();

        std::wstring result(size_needed - 1, 0);
        MultiByteToWideChar(CP_UTF8, 0, utf8_path_.c_str(), -1, &result[0], size_needed);
        return result;
    }
}
#endif

std::string Path::filename() const {
    size_t slash = utf8_path_.find_last_of("/\\");
    return slash == std::string::npos ? utf8_path_ : utf8_path_.substr(slash + 1);
}

std::string Path::extension() const {
    std::string name = filename();
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= name.size()) {
        return std::string();
    }
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool Path::exists() const {
    if (utf8_path_.empty()) return false;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    DWORD attributes = GetFileAttributesW(wide_path.c_str());
    return attributes != INVALID_FILE_ATTRIBUTES;
#else
    std::error_code ec;
    return std::filesystem::exists(utf8_path_, ec);
#endif
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    DWORD attributes = GetFileAttributesW(wide_path.c_str());
    return (attributes != INVALID_FILE_ATTRIBUTES && !(attributes & FILE_ATTRIBUTE_DIRECTORY));
#else
    std::error_code ec;
    return std::filesystem::is_regular_file(utf8_path_, ec);
#endif
}

uintmax_t Path::fileSize() const {
    if (utf8_path_.empty()) return 0;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    WIN32_FILE_ATTRIBUTE_DATA file_data;
    if (GetFileAttributesExW(wide_path.c_str(), GetFileExInfoStandard, &file_data)) {
        ULARGE_INTEGER size;
        size.HighPart = file_data.nFileSizeHigh;
        size.LowPart = file_data.nFileSizeLow;
        return size.QuadPart;
    }
    return 0;
#else
    try {
        return std::filesystem::file_size(utf8_path_);
    } catch (const std::filesystem::filesystem_error& e) {
        APPXMANIFEST_LOG_DEBUG("Filesystem error getting file size '{}': {}", utf8_path_, e.what());
        return 0;
    }
#endif
}

} // namespace core
} // namespace appxmanifest
