#pragma once

#include "appxmanifest/archive/ZipError.hpp"
#include "appxmanifest/core/Path.hpp"
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace appxmanifest {
namespace archive {

/**
 * @brief 只读ZIP读取器（基于minizip-ng）
 *
 * 特性：
 * - 数据源可以是磁盘文件，也可以是内存缓冲区（嵌套程序包）
 * - 条目按中央目录顺序缓存
 * - 单条目流式读取：同一时刻只能打开一个条目
 */
class ZipReader {
public:
    // ========== 条目信息结构 ==========
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        int compression_method = 0;
        time_t modified_date = 0;
        bool is_directory = false;
    };

    // ========== 构造/析构 ==========

    /**
     * @brief 以磁盘文件作为数据源
     */
    explicit ZipReader(const core::Path& path);

    /**
     * @brief 以内存缓冲区作为数据源，读取器持有缓冲区直到析构
     * @param buffer ZIP字节
     * @param name 用于日志的名称
     */
    ZipReader(std::vector<uint8_t> buffer, std::string name);

    ~ZipReader();

    // 禁止拷贝
    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    // minizip持有buffer_的地址，不支持移动
    ZipReader(ZipReader&&) = delete;
    ZipReader& operator=(ZipReader&&) = delete;

    // ========== 打开/关闭 ==========

    /**
     * 打开ZIP并读取中央目录
     * @return BadFormat 表示数据不是合法的ZIP
     */
    ZipError open();

    /**
     * 关闭ZIP（幂等），未关闭的条目一并关闭
     */
    ZipError close();

    bool isOpen() const { return is_open_; }
    bool isMemoryBacked() const { return memory_backed_; }

    /**
     * 数据源名称（文件路径或内存源名称）
     */
    const std::string& getName() const { return filename_; }

    // ========== 条目查询 ==========

    /**
     * 按中央目录顺序返回所有条目
     */
    const std::vector<EntryInfo>& entries() const { return entries_; }

    /**
     * 按条目名精确查找
     * @return 未找到返回nullptr
     */
    const EntryInfo* findEntry(std::string_view internal_path) const;

    // ========== 流式读取 ==========

    /**
     * 打开条目准备读取
     */
    ZipError openEntry(std::string_view internal_path);

    /**
     * 从当前条目读取数据
     * @param buffer 输出缓冲区
     * @param size 缓冲区大小
     * @param bytes_read 实际读取字节数，0表示条目已读完
     */
    ZipError readEntry(void* buffer, size_t size, size_t& bytes_read);

    /**
     * 关闭当前条目，CRC校验失败时返回BadFormat
     */
    ZipError closeEntry();

    bool isEntryOpen() const { return entry_open_; }

    // ========== 整条目提取 ==========

    /**
     * 提取条目到字节数组
     * @param max_size 允许的最大解压大小，超过返回TooLarge
     */
    ZipError extractFile(std::string_view internal_path, std::vector<uint8_t>& data,
                         uint64_t max_size = UINT64_MAX);

    ZipError extractFile(std::string_view internal_path, std::string& content,
                         uint64_t max_size = UINT64_MAX);

private:
    void* unzip_handle_ = nullptr;
    core::Path filepath_;
    std::string filename_;  // UTF-8 名称，用于日志
    std::vector<uint8_t> buffer_;
    bool memory_backed_ = false;
    bool is_open_ = false;
    bool entry_open_ = false;
    int32_t last_native_error_ = 0;

    // 条目信息缓存（中央目录顺序 + 名称索引）
    std::vector<EntryInfo> entries_;
    std::unordered_map<std::string, size_t> entry_index_;

    ZipError initializeReader();
    void cleanup();
    ZipError buildEntryCache();
};

}} // namespace appxmanifest::archive
