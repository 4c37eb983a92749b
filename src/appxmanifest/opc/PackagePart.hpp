#pragma once

#include <cstdint>
#include <string>

namespace appxmanifest {
namespace opc {

/**
 * @brief 容器中的一个部件
 *
 * 部件只是容器的描述信息，不持有数据；数据通过PackageContainer::openPartStream()读取。
 * 部件的生命周期不超过所属容器。
 */
struct PackagePart {
    std::string uri;           // "/" + 百分号解码后的条目名，容器内唯一
    std::string content_type;  // 声明的内容类型，按原样保存
    std::string entry_name;    // ZIP条目名（未解码）
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
};

}} // namespace appxmanifest::opc
