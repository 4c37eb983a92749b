#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace appxmanifest {
namespace core {

/**
 * @brief AppxManifest统一错误码
 *
 * 每个错误码对应提取流程中的一类失败：
 * - 文件类：路径不存在、读取失败
 * - 容器类：不是合法的ZIP/OPC容器、部件缺失、部件过大
 * - 清单类：Bundle清单中没有主程序包、XML格式错误
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileReadError = 24,

    // 容器/部件错误 (40-59)
    ContainerFormatError = 40,
    PartNotFound = 41,
    PartTooLarge = 42,

    // 清单/XML处理错误 (60-79)
    MainPackageNotFound = 60,
    XmlParseError = 61
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码名称（枚举名），用于日志和诊断输出
 */
const char* codeName(ErrorCode code) noexcept;

}} // namespace appxmanifest::core
