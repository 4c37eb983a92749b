#include "appxmanifest/manifest/ManifestExtractor.hpp"
#include "appxmanifest/core/Constants.hpp"
#include "appxmanifest/core/Exception.hpp"
#include "appxmanifest/manifest/BundleManifestParser.hpp"
#include "appxmanifest/opc/PartResolver.hpp"
#include "appxmanifest/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace appxmanifest {
namespace manifest {

using opc::PackageContainer;
using opc::PartResolver;

ManifestExtractor::ManifestExtractor(const core::ExtractOptions& options)
    : options_(options) {
}

ManifestDocument ManifestExtractor::extractFromPackage(const core::Path& path) const {
    MANIFEST_INFO("Extracting manifest from package {}", path.string());
    try {
        auto container = PackageContainer::openFile(path, options_);
        ManifestDocument document = extractFromContainer(*container);
        container->close();
        return document;
    } catch (core::AppxManifestException& e) {
        e.addContext(fmt::format("extracting manifest from package {}", path.string()));
        throw;
    }
}

ManifestDocument ManifestExtractor::extractFromBundle(const core::Path& path) const {
    MANIFEST_INFO("Extracting manifest from bundle {}", path.string());
    try {
        auto bundle = PackageContainer::openFile(path, options_);
        ManifestDocument document = extractFromBundleContainer(*bundle);
        bundle->close();
        return document;
    } catch (core::AppxManifestException& e) {
        e.addContext(fmt::format("extracting manifest from bundle {}", path.string()));
        throw;
    }
}

ManifestDocument ManifestExtractor::extract(const core::Path& path) const {
    try {
        auto container = PackageContainer::openFile(path, options_);

        ManifestDocument document = PartResolver::tryFindByContentType(*container, core::ContentType::kBundleManifest)
            ? extractFromBundleContainer(*container)
            : extractFromContainer(*container);

        container->close();
        return document;
    } catch (core::AppxManifestException& e) {
        e.addContext(fmt::format("extracting manifest from {}", path.string()));
        throw;
    }
}

BundleManifest ManifestExtractor::readBundleManifest(const core::Path& path) const {
    try {
        auto bundle = PackageContainer::openFile(path, options_);
        BundleManifest bundle_manifest = parseBundleManifest(*bundle);
        bundle->close();
        return bundle_manifest;
    } catch (core::AppxManifestException& e) {
        e.addContext(fmt::format("reading bundle manifest from {}", path.string()));
        throw;
    }
}

ManifestDocument ManifestExtractor::extractFromContainer(PackageContainer& container) const {
    const opc::PackagePart& part = PartResolver::findByContentType(container, core::ContentType::kAppxManifest);
    std::string xml_content = readXmlPart(container, part);
    return ManifestDocument::parse(xml_content, container.name() + part.uri);
}

// 内部辅助方法

BundleManifest ManifestExtractor::parseBundleManifest(PackageContainer& bundle) const {
    const opc::PackagePart& part = PartResolver::findByContentType(bundle, core::ContentType::kBundleManifest);
    std::string xml_content = readXmlPart(bundle, part);

    BundleManifestParser parser;
    if (!parser.parse(xml_content)) {
        MANIFEST_ERROR("Malformed bundle manifest {}{}: {}", bundle.name(), part.uri, parser.getErrorMessage());
        throw core::XMLException(fmt::format("Malformed bundle manifest: {}", parser.getErrorMessage()),
                                 bundle.name() + part.uri, parser.getErrorLine(), __FILE__, __LINE__);
    }

    BundleManifest bundle_manifest = parser.takeManifest();
    MANIFEST_DEBUG("Bundle manifest lists {} packages", bundle_manifest.packages.size());
    return bundle_manifest;
}

ManifestDocument ManifestExtractor::extractFromBundleContainer(PackageContainer& bundle) const {
    BundleManifest bundle_manifest = parseBundleManifest(bundle);

    const BundlePackageEntry* main_package = bundle_manifest.mainPackage();
    if (!main_package) {
        MANIFEST_ERROR("No Application package in bundle {}", bundle.name());
        throw core::MainPackageNotFoundException(
            fmt::format("No Application package in bundle manifest of {}", bundle.name()), __FILE__, __LINE__);
    }

    if (bundle_manifest.applicationPackageCount() > 1) {
        MANIFEST_DEBUG("Bundle {} lists {} Application packages, using {}",
                       bundle.name(), bundle_manifest.applicationPackageCount(), main_package->file_name);
    }

    const opc::PackagePart& package_part = PartResolver::findByUri(bundle, main_package->partUri());
    MANIFEST_DEBUG("Main package {} ({} bytes)", package_part.uri, package_part.uncompressed_size);

    // 嵌套容器先于外层容器关闭
    auto inner = PackageContainer::openNested(bundle, package_part, options_);
    ManifestDocument document = extractFromContainer(*inner);
    inner->close();
    return document;
}

std::string ManifestExtractor::readXmlPart(PackageContainer& container, const opc::PackagePart& part) const {
    opc::PartStream stream = container.openPartStream(part);
    return stream.readAllText(options_.max_xml_part_size);
}

}} // namespace appxmanifest::manifest
