#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 * 便于调试时快速识别日志来源和等级
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    APPXMANIFEST_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     APPXMANIFEST_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     APPXMANIFEST_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    APPXMANIFEST_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)    APPXMANIFEST_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_INFO(...)     APPXMANIFEST_LOG_INFO("[INF][xml ] " __VA_ARGS__)
#define XML_WARN(...)     APPXMANIFEST_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)    APPXMANIFEST_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...)    APPXMANIFEST_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)     APPXMANIFEST_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)     APPXMANIFEST_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...)    APPXMANIFEST_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// OPC模块 (opc)
#define OPC_DEBUG(...)    APPXMANIFEST_LOG_DEBUG("[DBG][opc ] " __VA_ARGS__)
#define OPC_INFO(...)     APPXMANIFEST_LOG_INFO("[INF][opc ] " __VA_ARGS__)
#define OPC_WARN(...)     APPXMANIFEST_LOG_WARN("[WRN][opc ] " __VA_ARGS__)
#define OPC_ERROR(...)    APPXMANIFEST_LOG_ERROR("[ERR][opc ] " __VA_ARGS__)

// 清单模块 (manifest)
#define MANIFEST_DEBUG(...)    APPXMANIFEST_LOG_DEBUG("[DBG][mfst] " __VA_ARGS__)
#define MANIFEST_INFO(...)     APPXMANIFEST_LOG_INFO("[INF][mfst] " __VA_ARGS__)
#define MANIFEST_WARN(...)     APPXMANIFEST_LOG_WARN("[WRN][mfst] " __VA_ARGS__)
#define MANIFEST_ERROR(...)    APPXMANIFEST_LOG_ERROR("[ERR][mfst] " __VA_ARGS__)

// 示例模块 (examples)
#define EXAMPLE_INFO(...)     APPXMANIFEST_LOG_INFO("[INF][demo] " __VA_ARGS__)
#define EXAMPLE_ERROR(...)    APPXMANIFEST_LOG_ERROR("[ERR][demo] " __VA_ARGS__)

// 条件日志宏 (使用模块宏实现)
#if ENABLE_ZIP_ENTRY_DEBUG_LOGS
    #define APPXMANIFEST_LOG_ZIP_ENTRY_DEBUG(...) ARCHIVE_DEBUG(__VA_ARGS__)
#else
    #define APPXMANIFEST_LOG_ZIP_ENTRY_DEBUG(...) do {} while(0)
#endif

#if ENABLE_XML_EVENT_DEBUG_LOGS
    #define APPXMANIFEST_LOG_XML_EVENT_DEBUG(...) XML_DEBUG(__VA_ARGS__)
#else
    #define APPXMANIFEST_LOG_XML_EVENT_DEBUG(...) do {} while(0)
#endif
