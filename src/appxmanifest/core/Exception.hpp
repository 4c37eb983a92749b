/**
 * @file Exception.hpp
 * @brief AppxManifest异常类定义
 */

#ifndef APPXMANIFEST_EXCEPTION_HPP
#define APPXMANIFEST_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace appxmanifest {
namespace core {

/**
 * @brief AppxManifest基础异常类
 *
 * 所有提取失败都以此类（或其子类）抛出，调用方可通过getErrorCode()区分错误种类。
 */
class AppxManifestException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    AppxManifestException(const std::string& message,
                          ErrorCode code = ErrorCode::InternalError,
                          const char* file = nullptr,
                          int line = 0);

    /**
     * @brief 获取错误代码
     */
    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 获取错误代码字符串
     */
    std::string getErrorCodeString() const;

    /**
     * @brief 获取详细错误信息
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    /**
     * @brief 添加上下文信息
     */
    void addContext(const std::string& context);

    const std::vector<std::string>& getContext() const { return context_; }

    /**
     * @brief 转换为Error结构
     */
    Error toError() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常（路径不存在、读取失败）
 */
class FileException : public AppxManifestException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 容器格式异常（不是合法的程序包容器）
 */
class ContainerFormatException : public AppxManifestException {
public:
    ContainerFormatException(const std::string& message,
                             const std::string& container_name = "",
                             ErrorCode code = ErrorCode::ContainerFormatError,
                             const char* file = nullptr, int line = 0);

    const std::string& getContainerName() const { return container_name_; }

private:
    std::string container_name_;
};

/**
 * @brief 部件未找到异常
 */
class PartNotFoundException : public AppxManifestException {
public:
    /**
     * @param message 错误消息
     * @param key 查找使用的键（内容类型或URI）
     */
    PartNotFoundException(const std::string& message,
                          const std::string& key,
                          const char* file = nullptr, int line = 0);

    const std::string& getKey() const { return key_; }

private:
    std::string key_;
};

/**
 * @brief Bundle清单中没有类型为Application的程序包
 */
class MainPackageNotFoundException : public AppxManifestException {
public:
    MainPackageNotFoundException(const std::string& message,
                                 const char* file = nullptr, int line = 0);
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public AppxManifestException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief XML解析异常
 */
class XMLException : public AppxManifestException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path = "",
                 int xml_line = -1,
                 const char* file = nullptr, int line = 0);

    const std::string& getXMLPath() const { return xml_path_; }
    int getXMLLine() const { return xml_line_; }

private:
    std::string xml_path_;
    int xml_line_;
};

} // namespace core
} // namespace appxmanifest

#endif // APPXMANIFEST_EXCEPTION_HPP
