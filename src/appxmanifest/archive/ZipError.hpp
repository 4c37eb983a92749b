#pragma once

namespace appxmanifest {
namespace archive {

// 错误码枚举
enum class ZipError {
    Ok,                    // 操作成功
    NotOpen,               // ZIP 未打开
    IoFail,                // I/O 操作失败
    BadFormat,             // ZIP 格式错误
    TooLarge,              // 条目超过允许的大小
    FileNotFound,          // 条目未找到
    InvalidParameter,      // 无效参数
    InternalError          // 内部错误
};

constexpr bool isError(ZipError error) noexcept {
    return error != ZipError::Ok;
}

constexpr const char* toString(ZipError error) noexcept {
    switch (error) {
        case ZipError::Ok: return "Ok";
        case ZipError::NotOpen: return "NotOpen";
        case ZipError::IoFail: return "IoFail";
        case ZipError::BadFormat: return "BadFormat";
        case ZipError::TooLarge: return "TooLarge";
        case ZipError::FileNotFound: return "FileNotFound";
        case ZipError::InvalidParameter: return "InvalidParameter";
        case ZipError::InternalError: return "InternalError";
    }
    return "Unknown";
}

}} // namespace appxmanifest::archive
