#include "appxmanifest/opc/ZipExceptionBridge.hpp"
#include "appxmanifest/core/Exception.hpp"
#include <fmt/format.h>

namespace appxmanifest {
namespace opc {

void ZipExceptionBridge::throwFromZipError(archive::ZipError error,
                                           const std::string& message,
                                           const std::string& source,
                                           const std::string& key) {
    std::string full_message = fmt::format("{} ({}, {})", message, source, archive::toString(error));

    switch (error) {
        case archive::ZipError::BadFormat:
            throw core::ContainerFormatException(full_message, source, core::ErrorCode::ContainerFormatError,
                                                 __FILE__, __LINE__);

        case archive::ZipError::TooLarge:
            throw core::ContainerFormatException(full_message, source, core::ErrorCode::PartTooLarge,
                                                 __FILE__, __LINE__);

        case archive::ZipError::FileNotFound:
            throw core::PartNotFoundException(message, key, __FILE__, __LINE__);

        case archive::ZipError::IoFail:
            throw core::FileException(full_message, source, core::ErrorCode::FileReadError,
                                      __FILE__, __LINE__);

        case archive::ZipError::NotOpen:
        case archive::ZipError::InvalidParameter:
            throw core::ParameterException(full_message, key, __FILE__, __LINE__);

        default:
            throw core::AppxManifestException(full_message, core::ErrorCode::InternalError,
                                              __FILE__, __LINE__);
    }
}

}} // namespace appxmanifest::opc
