/**
 * @file Exception.cpp
 * @brief AppxManifest异常类实现
 */

#include "Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace appxmanifest {
namespace core {

// AppxManifestException 实现
AppxManifestException::AppxManifestException(const std::string& message,
                                             ErrorCode code,
                                             const char* file,
                                             int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string AppxManifestException::getErrorCodeString() const {
    return codeName(error_code_);
}

std::string AppxManifestException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void AppxManifestException::addContext(const std::string& context) {
    context_.push_back(context);
}

Error AppxManifestException::toError() const {
    std::string ctx;
    for (const auto& item : context_) {
        if (!ctx.empty()) {
            ctx += "; ";
        }
        ctx += item;
    }
    return Error(error_code_, what(), ctx);
}

// FileException 实现
FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : AppxManifestException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

// ContainerFormatException 实现
ContainerFormatException::ContainerFormatException(const std::string& message,
                                                   const std::string& container_name,
                                                   ErrorCode code, const char* file, int line)
    : AppxManifestException(container_name.empty()
                                ? message
                                : fmt::format("{} (container: {})", message, container_name),
                            code, file, line)
    , container_name_(container_name) {
}

// PartNotFoundException 实现
PartNotFoundException::PartNotFoundException(const std::string& message,
                                             const std::string& key,
                                             const char* file, int line)
    : AppxManifestException(fmt::format("{}: {}", message, key), ErrorCode::PartNotFound, file, line)
    , key_(key) {
}

// MainPackageNotFoundException 实现
MainPackageNotFoundException::MainPackageNotFoundException(const std::string& message,
                                                           const char* file, int line)
    : AppxManifestException(message, ErrorCode::MainPackageNotFound, file, line) {
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : AppxManifestException(fmt::format("{} (parameter: {})", message, parameter_name),
                            ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

// XMLException 实现
XMLException::XMLException(const std::string& message,
                           const std::string& xml_path,
                           int xml_line, const char* file, int line)
    : AppxManifestException(xml_path.empty()
                                ? message
                                : fmt::format("{} (part: {})", message, xml_path),
                            ErrorCode::XmlParseError, file, line)
    , xml_path_(xml_path)
    , xml_line_(xml_line) {
}

} // namespace core
} // namespace appxmanifest
