#pragma once

#include "appxmanifest/core/Constants.hpp"
#include <cstdint>
#include <limits>

namespace appxmanifest {
namespace core {

/**
 * @brief 清单提取选项
 *
 * 限制读入内存的数据量：清单部件只应是很小的XML文档，
 * 嵌套程序包则整体读入内存后作为容器打开。
 */
struct ExtractOptions {
    // 清单/Bundle清单部件的最大字节数
    uint64_t max_xml_part_size = 16ull * 1024 * 1024;

    // 嵌套程序包的最大字节数（minizip内存缓冲区以int32计长）
    uint64_t max_nested_package_size = static_cast<uint64_t>(std::numeric_limits<int32_t>::max());

    // 部件流的分块读取大小
    size_t read_buffer_size = 64 * 1024;

    ExtractOptions() = default;
};

} // namespace core
} // namespace appxmanifest
