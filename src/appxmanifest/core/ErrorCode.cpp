#include "appxmanifest/core/ErrorCode.hpp"

namespace appxmanifest {
namespace core {

// Error类构造函数实现
Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        // 成功
        case ErrorCode::Ok:
            return "Success";

        // 通用错误 (1-19)
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";

        // 文件操作错误 (20-39)
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileReadError:
            return "File read error";

        // 容器/部件错误 (40-59)
        case ErrorCode::ContainerFormatError:
            return "Invalid package container";
        case ErrorCode::PartNotFound:
            return "Package part not found";
        case ErrorCode::PartTooLarge:
            return "Package part too large";

        // 清单/XML处理错误 (60-79)
        case ErrorCode::MainPackageNotFound:
            return "Main application package not found in bundle";
        case ErrorCode::XmlParseError:
            return "XML parse error";

        default:
            return "Unknown error";
    }
}

const char* codeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::ContainerFormatError: return "ContainerFormatError";
        case ErrorCode::PartNotFound: return "PartNotFound";
        case ErrorCode::PartTooLarge: return "PartTooLarge";
        case ErrorCode::MainPackageNotFound: return "MainPackageNotFound";
        case ErrorCode::XmlParseError: return "XmlParseError";
        default: return "Unknown";
    }
}

}} // namespace appxmanifest::core
