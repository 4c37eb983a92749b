#include "appxmanifest/opc/PackageContainer.hpp"
#include "appxmanifest/core/Constants.hpp"
#include "appxmanifest/core/Exception.hpp"
#include "appxmanifest/opc/ContentTypesParser.hpp"
#include "appxmanifest/opc/PackageTypes.hpp"
#include "appxmanifest/opc/ZipExceptionBridge.hpp"
#include "appxmanifest/utils/CommonUtils.hpp"
#include "appxmanifest/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <unordered_set>

namespace appxmanifest {
namespace opc {

using utils::CommonUtils;

PackageContainer::PackageContainer(std::unique_ptr<archive::ZipReader> reader,
                                   std::string name,
                                   const core::ExtractOptions& options)
    : reader_(std::move(reader)), name_(std::move(name)), options_(options) {
}

PackageContainer::~PackageContainer() {
    close();
}

// ========== 打开 ==========

std::unique_ptr<PackageContainer> PackageContainer::openFile(const core::Path& path,
                                                             const core::ExtractOptions& options) {
    if (path.empty() || !path.exists()) {
        OPC_ERROR("Package file not found: {}", path.string());
        throw core::FileException("Package file not found", path.string(),
                                  core::ErrorCode::FileNotFound, __FILE__, __LINE__);
    }

    if (!path.isFile()) {
        OPC_ERROR("Package path is not a regular file: {}", path.string());
        throw core::FileException("Package path is not a regular file", path.string(),
                                  core::ErrorCode::FileNotFound, __FILE__, __LINE__);
    }

    std::unique_ptr<PackageContainer> container(
        new PackageContainer(std::make_unique<archive::ZipReader>(path), path.string(), options));
    container->load();
    return container;
}

std::unique_ptr<PackageContainer> PackageContainer::openBuffer(std::vector<uint8_t> bytes,
                                                               const std::string& name,
                                                               const core::ExtractOptions& options) {
    std::unique_ptr<PackageContainer> container(
        new PackageContainer(std::make_unique<archive::ZipReader>(std::move(bytes), name), name, options));
    container->load();
    return container;
}

std::unique_ptr<PackageContainer> PackageContainer::openNested(PackageContainer& outer,
                                                               const PackagePart& part,
                                                               const core::ExtractOptions& options) {
    std::vector<uint8_t> bytes;
    {
        PartStream stream = outer.openPartStream(part);
        bytes = stream.readAll(options.max_nested_package_size);
    }

    OPC_DEBUG("Opening nested package {} from {} ({} bytes)", part.uri, outer.name(), bytes.size());
    return openBuffer(std::move(bytes), outer.name() + part.uri, options);
}

void PackageContainer::load() {
    registerPackageTypes();

    archive::ZipError result = reader_->open();
    if (archive::isError(result)) {
        OPC_ERROR("Failed to open package container {}: {}", name_, archive::toString(result));
        ZipExceptionBridge::throwFromZipError(result, "Not a valid package container", name_);
    }

    loadContentTypes();

    OPC_DEBUG("Opened package container {} with {} parts", name_, parts_.size());
}

void PackageContainer::loadContentTypes() {
    // [Content_Types].xml 的条目名按不区分大小写匹配
    const archive::ZipReader::EntryInfo* types_entry = reader_->findEntry(core::kContentTypesEntry);
    if (!types_entry) {
        for (const auto& entry : reader_->entries()) {
            if (CommonUtils::equalsIgnoreCase(entry.path, core::kContentTypesEntry)) {
                types_entry = &entry;
                break;
            }
        }
    }

    if (!types_entry) {
        OPC_ERROR("Missing {} in {}", core::kContentTypesEntry, name_);
        throw core::ContainerFormatException(fmt::format("Missing {}", core::kContentTypesEntry), name_,
                                             core::ErrorCode::ContainerFormatError, __FILE__, __LINE__);
    }

    std::string types_xml;
    archive::ZipError result = reader_->extractFile(types_entry->path, types_xml, options_.max_xml_part_size);
    if (archive::isError(result)) {
        OPC_ERROR("Failed to read {} from {}: {}", types_entry->path, name_, archive::toString(result));
        ZipExceptionBridge::throwFromZipError(result, "Failed to read content types", name_, types_entry->path);
    }

    ContentTypesParser content_types;
    if (!content_types.parse(types_xml)) {
        OPC_ERROR("Malformed {} in {}: {}", core::kContentTypesEntry, name_, content_types.getErrorMessage());
        throw core::ContainerFormatException(
            fmt::format("Malformed {}: {}", core::kContentTypesEntry, content_types.getErrorMessage()),
            name_, core::ErrorCode::ContainerFormatError, __FILE__, __LINE__);
    }

    parts_.clear();
    parts_.reserve(reader_->entries().size());
    std::unordered_set<std::string> seen_uris;

    for (const auto& entry : reader_->entries()) {
        if (entry.is_directory || &entry == types_entry) {
            continue;
        }

        PackagePart part;
        part.entry_name = entry.path;
        part.uri = "/" + CommonUtils::percentDecode(entry.path);
        part.compressed_size = entry.compressed_size;
        part.uncompressed_size = entry.uncompressed_size;
        part.content_type = content_types.getContentType(part.uri);

        if (part.content_type.empty()) {
            OPC_ERROR("Part {} in {} has no content type", part.uri, name_);
            throw core::ContainerFormatException(fmt::format("Part has no content type: {}", part.uri),
                                                 name_, core::ErrorCode::ContainerFormatError,
                                                 __FILE__, __LINE__);
        }

        // 部件URI按ASCII不区分大小写必须唯一
        if (!seen_uris.insert(CommonUtils::toLowerAscii(part.uri)).second) {
            OPC_ERROR("Duplicate part {} in {}", part.uri, name_);
            throw core::ContainerFormatException(fmt::format("Duplicate part name: {}", part.uri),
                                                 name_, core::ErrorCode::ContainerFormatError,
                                                 __FILE__, __LINE__);
        }

        OPC_DEBUG("Part {} -> {} ({})", part.uri, part.content_type, describeContentType(part.content_type));
        parts_.push_back(std::move(part));
    }
}

// ========== 状态 ==========

void PackageContainer::close() noexcept {
    if (active_stream_) {
        OPC_WARN("Closing container {} with an open part stream", name_);
        active_stream_->close();
        active_stream_ = nullptr;
    }

    if (reader_ && reader_->isOpen()) {
        archive::ZipError result = reader_->close();
        if (archive::isError(result)) {
            OPC_WARN("Error while closing container {}: {}", name_, archive::toString(result));
        }
        OPC_DEBUG("Closed package container {}", name_);
    }
}

bool PackageContainer::isOpen() const {
    return reader_ && reader_->isOpen();
}

// ========== 读取 ==========

PartStream PackageContainer::openPartStream(const PackagePart& part) {
    if (!isOpen()) {
        OPC_ERROR("Container {} is closed", name_);
        throw core::ParameterException(fmt::format("Container is closed: {}", name_), "container",
                                       __FILE__, __LINE__);
    }

    if (active_stream_) {
        OPC_ERROR("Container {} already has an open part stream ({})", name_, active_stream_->part().uri);
        throw core::ParameterException(
            fmt::format("Another part stream is already open in {}", name_), "part", __FILE__, __LINE__);
    }

    if (!reader_->findEntry(part.entry_name)) {
        OPC_ERROR("Part {} does not belong to container {}", part.uri, name_);
        throw core::PartNotFoundException("Part not found in container", part.uri, __FILE__, __LINE__);
    }

    archive::ZipError result = reader_->openEntry(part.entry_name);
    if (archive::isError(result)) {
        OPC_ERROR("Failed to open part {} in {}: {}", part.uri, name_, archive::toString(result));
        ZipExceptionBridge::throwFromZipError(result, "Failed to open part", name_, part.uri);
    }

    return PartStream(*this, part, options_.read_buffer_size);
}

}} // namespace appxmanifest::opc
