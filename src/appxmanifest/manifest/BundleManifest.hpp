#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace appxmanifest {
namespace manifest {

/**
 * @brief Bundle清单中的一个Package条目
 */
struct BundlePackageEntry {
    std::string file_name;     // FileName，对应外层容器中的部件 "/" + FileName
    std::string type;          // Type："application" 或 "resource"
    std::string architecture;  // Architecture（可选）
    std::string version;       // Version（可选）
    std::string resource_id;   // ResourceId（可选）
    std::optional<uint64_t> offset;  // Offset：程序包在bundle文件中的偏移
    std::optional<uint64_t> size;    // Size：程序包字节数

    /**
     * @brief Type是否为Application（按ASCII不区分大小写比较）
     */
    bool isApplication() const;

    /**
     * @brief 对应的部件URI
     */
    std::string partUri() const { return "/" + file_name; }
};

/**
 * @brief Bundle的Identity元素
 */
struct BundleIdentity {
    std::string name;
    std::string publisher;
    std::string version;
};

/**
 * @brief 解析后的Bundle清单
 */
struct BundleManifest {
    std::vector<BundlePackageEntry> packages;  // 文档顺序
    std::optional<BundleIdentity> identity;

    /**
     * @brief 主程序包：文档顺序中第一个Type为Application的条目
     * @return 没有时返回nullptr
     */
    const BundlePackageEntry* mainPackage() const;

    /**
     * @brief 所有Application条目的数量
     */
    size_t applicationPackageCount() const;
};

}} // namespace appxmanifest::manifest
