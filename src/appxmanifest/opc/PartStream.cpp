#include "appxmanifest/opc/PartStream.hpp"
#include "appxmanifest/core/Exception.hpp"
#include "appxmanifest/opc/PackageContainer.hpp"
#include "appxmanifest/opc/ZipExceptionBridge.hpp"
#include "appxmanifest/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace appxmanifest {
namespace opc {

PartStream::PartStream(PackageContainer& container, const PackagePart& part, size_t buffer_size)
    : container_(&container), part_(&part), buffer_size_(std::max<size_t>(buffer_size, 1)) {
    container_->attachStream(this);
}

PartStream::~PartStream() {
    close();
}

PartStream::PartStream(PartStream&& other) noexcept
    : container_(other.container_),
      part_(other.part_),
      buffer_size_(other.buffer_size_),
      bytes_read_(other.bytes_read_),
      at_end_(other.at_end_) {
    other.container_ = nullptr;
    if (container_) {
        container_->attachStream(this);
    }
}

PartStream& PartStream::operator=(PartStream&& other) noexcept {
    if (this != &other) {
        close();
        container_ = other.container_;
        part_ = other.part_;
        buffer_size_ = other.buffer_size_;
        bytes_read_ = other.bytes_read_;
        at_end_ = other.at_end_;

        other.container_ = nullptr;
        if (container_) {
            container_->attachStream(this);
        }
    }
    return *this;
}

size_t PartStream::read(void* buffer, size_t size) {
    if (!container_) {
        throw core::ParameterException("Part stream is closed", "stream", __FILE__, __LINE__);
    }

    if (at_end_ || size == 0) {
        return 0;
    }

    size_t bytes = 0;
    archive::ZipError result = container_->reader().readEntry(buffer, size, bytes);
    if (archive::isError(result)) {
        OPC_ERROR("Failed to read part {} from {}: {}", part_->uri, container_->name(), archive::toString(result));
        ZipExceptionBridge::throwFromZipError(result, "Failed to read part", container_->name(), part_->uri);
    }

    if (bytes == 0) {
        at_end_ = true;
    }
    bytes_read_ += bytes;
    return bytes;
}

std::vector<uint8_t> PartStream::readAll(uint64_t max_size) {
    if (!container_) {
        throw core::ParameterException("Part stream is closed", "stream", __FILE__, __LINE__);
    }

    if (part_->uncompressed_size > max_size) {
        OPC_ERROR("Part {} is too large ({} bytes, limit {} bytes)", part_->uri, part_->uncompressed_size, max_size);
        throw core::ContainerFormatException(
            fmt::format("Part {} is too large ({} bytes, limit {} bytes)", part_->uri, part_->uncompressed_size, max_size),
            container_->name(), core::ErrorCode::PartTooLarge, __FILE__, __LINE__);
    }

    std::vector<uint8_t> data;
    data.reserve(static_cast<size_t>(part_->uncompressed_size));

    std::vector<uint8_t> buffer(buffer_size_);
    size_t bytes = 0;
    while ((bytes = read(buffer.data(), buffer.size())) > 0) {
        // 中央目录中的大小可能不可信，按实际读取量再检查一次
        if (data.size() + bytes > max_size) {
            OPC_ERROR("Part {} exceeds the size limit of {} bytes", part_->uri, max_size);
            throw core::ContainerFormatException(
                fmt::format("Part {} exceeds the size limit of {} bytes", part_->uri, max_size),
                container_->name(), core::ErrorCode::PartTooLarge, __FILE__, __LINE__);
        }
        data.insert(data.end(), buffer.data(), buffer.data() + bytes);
    }

    finish();
    return data;
}

std::string PartStream::readAllText(uint64_t max_size) {
    std::vector<uint8_t> data = readAll(max_size);
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

void PartStream::finish() {
    PackageContainer* container = container_;
    container_ = nullptr;
    container->detachStream(this);

    archive::ZipError result = container->reader().closeEntry();
    if (archive::isError(result)) {
        OPC_ERROR("Integrity check failed for part {} in {}", part_->uri, container->name());
        ZipExceptionBridge::throwFromZipError(result, "Part data is corrupt", container->name(), part_->uri);
    }
}

void PartStream::close() noexcept {
    if (!container_) {
        return;
    }

    PackageContainer* container = container_;
    container_ = nullptr;
    container->detachStream(this);

    archive::ZipError result = container->reader().closeEntry();
    if (archive::isError(result) && at_end_) {
        OPC_WARN("Error while closing part {} in {}: {}", part_->uri, container->name(), archive::toString(result));
    }
}

}} // namespace appxmanifest::opc
