#include "appxmanifest/manifest/ManifestDocument.hpp"
#include "appxmanifest/core/Exception.hpp"
#include "appxmanifest/utils/ModuleLoggers.hpp"
#include "appxmanifest/xml/XMLStreamReader.hpp"
#include <fmt/format.h>

namespace appxmanifest {
namespace manifest {

ManifestDocument ManifestDocument::parse(const std::string& xml_content, const std::string& source) {
    xml::XMLStreamReader reader;
    // 清单按原样保存：不做命名空间展开，也不裁剪空白
    reader.setNamespaceAware(false);
    reader.setTrimWhitespace(false);

    std::unique_ptr<xml::XMLElement> root = reader.parseToDOM(xml_content);
    if (!root) {
        MANIFEST_ERROR("Malformed manifest XML in {}: {}", source, reader.getLastErrorMessage());
        throw core::XMLException(fmt::format("Malformed manifest XML: {}", reader.getLastErrorMessage()),
                                 source, reader.getLastErrorLine(), __FILE__, __LINE__);
    }

    MANIFEST_DEBUG("Parsed manifest {} (root <{}>, {} elements)", source, root->getName(), reader.getElementsParsed());
    return ManifestDocument(std::move(root));
}

const xml::XMLElement& ManifestDocument::root() const {
    if (!root_) {
        throw core::ParameterException("Manifest document is empty (moved from)", "root", __FILE__, __LINE__);
    }
    return *root_;
}

bool ManifestDocument::operator==(const ManifestDocument& other) const {
    if (!root_ || !other.root_) {
        return !root_ && !other.root_;
    }
    return *root_ == *other.root_;
}

}} // namespace appxmanifest::manifest
