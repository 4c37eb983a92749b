#include "appxmanifest/AppxManifest.hpp"
#include "appxmanifest/utils/Logger.hpp"
#include <iostream>

namespace appxmanifest {

APPXMANIFEST_API bool initialize(const std::string& log_file_path, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, Logger::Level::INFO, enable_console);
        APPXMANIFEST_LOG_INFO("AppxManifest library initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统不可用，只能输出到标准错误
        if (enable_console) {
            std::cerr << "Failed to initialize AppxManifest: " << e.what() << std::endl;
        }
        return false;
    }
}

APPXMANIFEST_API void cleanup() {
    APPXMANIFEST_LOG_INFO("AppxManifest library cleanup completed");
    Logger::getInstance().shutdown();
}

APPXMANIFEST_API manifest::ManifestDocument extractManifest(const std::string& path) {
    return manifest::ManifestExtractor().extract(core::Path(path));
}

APPXMANIFEST_API manifest::ManifestDocument extractManifestFromPackage(const std::string& path) {
    return manifest::ManifestExtractor().extractFromPackage(core::Path(path));
}

APPXMANIFEST_API manifest::ManifestDocument extractManifestFromBundle(const std::string& path) {
    return manifest::ManifestExtractor().extractFromBundle(core::Path(path));
}

} // namespace appxmanifest
