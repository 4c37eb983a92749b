#pragma once

#include <cstddef>

namespace appxmanifest {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // I/O 缓冲区大小
    static constexpr size_t kIOBufferSize = 8192;
};

// 程序包部件的内容类型（精确匹配，区分大小写）
namespace ContentType {
    // 应用程序清单 AppxManifest.xml
    inline constexpr const char* kAppxManifest = "application/vnd.ms-appx.manifest+xml";
    // Bundle清单 AppxMetadata/AppxBundleManifest.xml
    inline constexpr const char* kBundleManifest = "application/vnd.ms-appx.bundlemanifest+xml";
    inline constexpr const char* kBlockMap = "application/vnd.ms-appx.blockmap+xml";
    inline constexpr const char* kSignature = "application/vnd.ms-appx.signature";
    inline constexpr const char* kCodeIntegrity = "application/vnd.ms-pkiseccat";
    // Bundle中嵌套的程序包
    inline constexpr const char* kPackage = "application/vnd.ms-appx";
    inline constexpr const char* kRelationships = "application/vnd.openxmlformats-package.relationships+xml";
    inline constexpr const char* kCoreProperties = "application/vnd.openxmlformats-package.core-properties+xml";
} // namespace ContentType

// OPC内容类型表的ZIP条目名（不属于任何部件）
inline constexpr const char* kContentTypesEntry = "[Content_Types].xml";

// Bundle清单中主程序包的类型值
inline constexpr const char* kApplicationPackageType = "Application";

} // namespace core
} // namespace appxmanifest
