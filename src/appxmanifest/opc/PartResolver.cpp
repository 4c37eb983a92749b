#include "appxmanifest/opc/PartResolver.hpp"
#include "appxmanifest/core/Exception.hpp"
#include "appxmanifest/utils/ModuleLoggers.hpp"

namespace appxmanifest {
namespace opc {

const PackagePart* PartResolver::tryFindByContentType(const PackageContainer& container, std::string_view content_type) {
    for (const auto& part : container.parts()) {
        if (part.content_type == content_type) {
            return &part;
        }
    }
    return nullptr;
}

const PackagePart* PartResolver::tryFindByUri(const PackageContainer& container, std::string_view uri) {
    for (const auto& part : container.parts()) {
        if (part.uri == uri) {
            return &part;
        }
    }
    return nullptr;
}

const PackagePart& PartResolver::findByContentType(const PackageContainer& container, std::string_view content_type) {
    const PackagePart* part = tryFindByContentType(container, content_type);
    if (!part) {
        OPC_ERROR("No part with content type {} in {}", content_type, container.name());
        throw core::PartNotFoundException("No part with content type", std::string(content_type),
                                          __FILE__, __LINE__);
    }
    OPC_DEBUG("Resolved content type {} to {}", content_type, part->uri);
    return *part;
}

const PackagePart& PartResolver::findByUri(const PackageContainer& container, std::string_view uri) {
    const PackagePart* part = tryFindByUri(container, uri);
    if (!part) {
        OPC_ERROR("No part {} in {}", uri, container.name());
        throw core::PartNotFoundException("No part with URI", std::string(uri), __FILE__, __LINE__);
    }
    return *part;
}

}} // namespace appxmanifest::opc
