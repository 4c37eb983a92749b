#pragma once

#include <string>
#include <string_view>

namespace appxmanifest {
namespace utils {

/**
 * @brief 通用工具类 - 部件名处理相关的辅助函数
 *
 * OPC部件名和扩展名按ASCII不区分大小写比较，非ASCII字节原样保留。
 */
class CommonUtils {
public:
    // ========== 字符串工具 ==========

    static char toLowerAscii(char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    /**
     * @brief ASCII小写化（只转换A-Z）
     */
    static std::string toLowerAscii(std::string_view str) {
        std::string result(str);
        for (char& c : result) {
            c = toLowerAscii(c);
        }
        return result;
    }

    /**
     * @brief ASCII不区分大小写比较
     */
    static bool equalsIgnoreCase(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (toLowerAscii(a[i]) != toLowerAscii(b[i])) {
                return false;
            }
        }
        return true;
    }

    /**
     * @brief 百分号解码（%XX -> 字节），不合法的转义序列原样保留
     */
    static std::string percentDecode(std::string_view str) {
        std::string result;
        result.reserve(str.size());
        for (size_t i = 0; i < str.size(); ++i) {
            if (str[i] == '%' && i + 2 < str.size()) {
                int high = hexValue(str[i + 1]);
                int low = hexValue(str[i + 2]);
                if (high >= 0 && low >= 0) {
                    result += static_cast<char>((high << 4) | low);
                    i += 2;
                    continue;
                }
            }
            result += str[i];
        }
        return result;
    }

    /**
     * @brief 取部件名最后一段的扩展名（不含点），没有扩展名时返回空
     */
    static std::string_view extensionOf(std::string_view part_name) {
        size_t slash = part_name.find_last_of('/');
        size_t dot = part_name.find_last_of('.');
        if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
            return std::string_view{};
        }
        return part_name.substr(dot + 1);
    }

private:
    static int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

}} // namespace appxmanifest::utils
