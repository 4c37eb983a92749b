/**
 * @file ZipExceptionBridge.hpp
 * @brief 异常转换层：把ZIP读取器的错误码转换为库的异常
 */

#pragma once

#include "appxmanifest/archive/ZipError.hpp"
#include <string>

namespace appxmanifest {
namespace opc {

/**
 * @brief ZipError到异常的映射
 *
 * - BadFormat        -> ContainerFormatException (ContainerFormatError)
 * - TooLarge         -> ContainerFormatException (PartTooLarge)
 * - FileNotFound     -> PartNotFoundException
 * - IoFail           -> FileException (FileReadError)
 * - NotOpen / InvalidParameter -> ParameterException
 * - InternalError    -> AppxManifestException
 */
class ZipExceptionBridge {
public:
    /**
     * @brief 抛出与错误码对应的异常
     * @param error 非Ok的错误码
     * @param message 错误消息
     * @param source 容器名称（文件路径或内存源名称）
     * @param key 涉及的条目名
     */
    [[noreturn]] static void throwFromZipError(archive::ZipError error,
                                               const std::string& message,
                                               const std::string& source,
                                               const std::string& key = "");

    /**
     * @brief 错误码为Ok时什么都不做，否则抛出
     */
    static void check(archive::ZipError error,
                      const std::string& message,
                      const std::string& source,
                      const std::string& key = "") {
        if (archive::isError(error)) {
            throwFromZipError(error, message, source, key);
        }
    }
};

}} // namespace appxmanifest::opc
