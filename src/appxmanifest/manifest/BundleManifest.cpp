#include "appxmanifest/manifest/BundleManifest.hpp"
#include "appxmanifest/core/Constants.hpp"
#include "appxmanifest/utils/CommonUtils.hpp"
#include <algorithm>

namespace appxmanifest {
namespace manifest {

bool BundlePackageEntry::isApplication() const {
    return utils::CommonUtils::equalsIgnoreCase(type, core::kApplicationPackageType);
}

const BundlePackageEntry* BundleManifest::mainPackage() const {
    for (const auto& entry : packages) {
        if (entry.isApplication()) {
            return &entry;
        }
    }
    return nullptr;
}

size_t BundleManifest::applicationPackageCount() const {
    return static_cast<size_t>(std::count_if(packages.begin(), packages.end(),
                                             [](const BundlePackageEntry& entry) { return entry.isApplication(); }));
}

}} // namespace appxmanifest::manifest
