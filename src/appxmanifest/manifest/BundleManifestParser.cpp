#include "appxmanifest/manifest/BundleManifestParser.hpp"
#include "appxmanifest/utils/ModuleLoggers.hpp"

namespace appxmanifest {
namespace manifest {

bool BundleManifestParser::parse(const char* data, size_t size) {
    manifest_ = BundleManifest();
    return parseXML(data, size);
}

void BundleManifestParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) {
    if (depth == 0) {
        if (name != "Bundle") {
            setError("Unexpected root element in bundle manifest: " + std::string(name));
        }
        return;
    }

    if (depth == 1 && name == "Identity") {
        BundleIdentity identity;
        identity.name = getAttributeOr(attributes, "Name", "");
        identity.publisher = getAttributeOr(attributes, "Publisher", "");
        identity.version = getAttributeOr(attributes, "Version", "");
        manifest_.identity = std::move(identity);
        return;
    }

    // Bundle/Packages/Package
    if (depth == 2 && name == "Package" && getParentElement() == "Packages") {
        BundlePackageEntry entry;
        entry.file_name = getAttributeOr(attributes, "FileName", "");
        entry.type = getAttributeOr(attributes, "Type", "");
        entry.architecture = getAttributeOr(attributes, "Architecture", "");
        entry.version = getAttributeOr(attributes, "Version", "");
        entry.resource_id = getAttributeOr(attributes, "ResourceId", "");
        entry.offset = findUInt64Attribute(attributes, "Offset");
        entry.size = findUInt64Attribute(attributes, "Size");

        MANIFEST_DEBUG("Bundle package entry: {} (Type={}, Architecture={})",
                       entry.file_name, entry.type, entry.architecture);
        manifest_.packages.push_back(std::move(entry));
    }
}

std::optional<uint64_t> BundleManifestParser::findUInt64Attribute(const std::vector<xml::XMLAttribute>& attributes,
                                                                  std::string_view name) const {
    auto val = findAttribute(attributes, name);
    if (!val || val->empty()) {
        return std::nullopt;
    }

    if ((*val)[0] < '0' || (*val)[0] > '9') {
        MANIFEST_WARN("Ignoring non-numeric {} attribute: '{}'", name, *val);
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        unsigned long long number = std::stoull(*val, &consumed);
        if (consumed == val->size()) {
            return static_cast<uint64_t>(number);
        }
    } catch (const std::exception&) {
        // 落到下面的警告
    }

    MANIFEST_WARN("Ignoring non-numeric {} attribute: '{}'", name, *val);
    return std::nullopt;
}

}} // namespace appxmanifest::manifest
