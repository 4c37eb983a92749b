#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#ifdef _WIN32
#include <utf8.h>
#endif

namespace appxmanifest {
namespace core {

/**
 * @brief UTF-8路径处理类，封装跨平台文件路径操作
 *
 * 使用utf8cpp库来处理Unicode文件路径，在Windows下自动处理UTF-8到UTF-16的转换，
 * 在其他平台直接使用UTF-8
 */
class Path {
private:
    std::string utf8_path_;

public:
    /**
     * @brief 构造函数
     * @param path UTF-8编码的路径字符串
     */
    explicit Path(const std::string& path);

    explicit Path(const char* path);

    Path() = default;
    Path(const Path& other) = default;
    Path(Path&& other) noexcept = default;
    Path& operator=(const Path& other) = default;
    Path& operator=(Path&& other) noexcept = default;
    ~Path() = default;

    // 路径操作
    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    /**
     * @brief 获取文件名部分（去除目录）
     */
    std::string filename() const;

    /**
     * @brief 获取小写扩展名（不含点），没有扩展名时返回空字符串
     */
    std::string extension() const;

    // 文件操作
    /**
     * @brief 检查文件是否存在
     */
    bool exists() const;

    /**
     * @brief 检查是否为普通文件
     */
    bool isFile() const;

    /**
     * @brief 获取文件大小
     * @return 文件大小（字节），失败返回0
     */
    uintmax_t fileSize() const;

#ifdef _WIN32
    std::wstring getWidePath() const;
#endif

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

} // namespace core
} // namespace appxmanifest
