#pragma once

// AppxManifest库 - 从appx程序包和appxbundle中读取应用程序清单

// === 核心公共接口 ===

#include "appxmanifest/core/ErrorCode.hpp"
#include "appxmanifest/core/Exception.hpp"
#include "appxmanifest/core/ExtractOptions.hpp"
#include "appxmanifest/core/Path.hpp"
#include "appxmanifest/manifest/BundleManifest.hpp"
#include "appxmanifest/manifest/ManifestDocument.hpp"
#include "appxmanifest/manifest/ManifestExtractor.hpp"

#include <string>

// 版本信息
#define APPXMANIFEST_VERSION_MAJOR 1
#define APPXMANIFEST_VERSION_MINOR 0
#define APPXMANIFEST_VERSION_PATCH 0
#define APPXMANIFEST_VERSION_STRING "1.0.0"

// 导出宏定义
#ifdef _WIN32
    #ifdef APPXMANIFEST_SHARED
        #ifdef APPXMANIFEST_EXPORTS
            #define APPXMANIFEST_API __declspec(dllexport)
        #else
            #define APPXMANIFEST_API __declspec(dllimport)
        #endif
    #else
        #define APPXMANIFEST_API
    #endif
#else
    #define APPXMANIFEST_API
#endif

namespace appxmanifest {

inline std::string getVersion() {
    return APPXMANIFEST_VERSION_STRING;
}

// 库初始化和清理

/**
 * @brief 初始化日志系统
 * @param log_file_path 日志文件路径，为空时不写文件
 * @param enable_console 是否输出到控制台（stderr）
 * @return 初始化是否成功
 *
 * 不调用也可以使用本库，此时只在控制台输出警告及以上级别的日志。
 */
APPXMANIFEST_API bool initialize(const std::string& log_file_path = "",
                                 bool enable_console = true);

/**
 * @brief 关闭日志文件
 */
APPXMANIFEST_API void cleanup();

// === 提取接口（使用默认选项） ===

/**
 * @brief 自动识别程序包或Bundle并提取清单
 * @throws core::AppxManifestException 及其子类
 */
APPXMANIFEST_API manifest::ManifestDocument extractManifest(const std::string& path);

/**
 * @brief 从单个程序包提取清单
 */
APPXMANIFEST_API manifest::ManifestDocument extractManifestFromPackage(const std::string& path);

/**
 * @brief 从Bundle提取主程序包的清单
 */
APPXMANIFEST_API manifest::ManifestDocument extractManifestFromBundle(const std::string& path);

} // namespace appxmanifest
