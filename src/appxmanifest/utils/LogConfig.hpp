#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的日志，设置为 1 启用

#define ENABLE_ZIP_ENTRY_DEBUG_LOGS 0    // 逐条目的ZIP调试日志（条目多时非常嘈杂）
#define ENABLE_XML_EVENT_DEBUG_LOGS 0    // 逐元素的SAX事件调试日志

// 条件日志宏在ModuleLoggers.hpp中使用模块宏来定义
// 例如：APPXMANIFEST_LOG_ZIP_ENTRY_DEBUG -> ARCHIVE_DEBUG
//       APPXMANIFEST_LOG_XML_EVENT_DEBUG -> XML_DEBUG
