#pragma once

#include "appxmanifest/opc/PackageContainer.hpp"
#include <string_view>

namespace appxmanifest {
namespace opc {

/**
 * @brief 在已打开的容器中查找部件
 *
 * 内容类型和URI都按原样精确比较（区分大小写）。
 * 有多个匹配时返回容器枚举顺序中的第一个。
 */
class PartResolver {
public:
    /**
     * @throws PartNotFoundException 没有匹配的部件
     */
    static const PackagePart& findByContentType(const PackageContainer& container, std::string_view content_type);

    /**
     * @throws PartNotFoundException 没有匹配的部件
     */
    static const PackagePart& findByUri(const PackageContainer& container, std::string_view uri);

    // 未找到时返回nullptr
    static const PackagePart* tryFindByContentType(const PackageContainer& container, std::string_view content_type);
    static const PackagePart* tryFindByUri(const PackageContainer& container, std::string_view uri);
};

}} // namespace appxmanifest::opc
