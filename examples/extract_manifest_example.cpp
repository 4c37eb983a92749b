/**
 * @file extract_manifest_example.cpp
 * @brief AppxManifest提取功能示例
 *
 * 用法: extract_manifest_example <package.appx | bundle.appxbundle>
 * 打印主程序包的清单；对Bundle额外列出其中的程序包。
 */

#include "appxmanifest/AppxManifest.hpp"
#include "appxmanifest/utils/ModuleLoggers.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "用法: " << argv[0] << " <package.appx | bundle.appxbundle>" << std::endl;
        return 1;
    }

    const std::string package_path = argv[1];
    appxmanifest::initialize("logs/extract_manifest.log", true);

    int exit_code = 0;
    try {
        appxmanifest::manifest::ManifestExtractor extractor;
        appxmanifest::core::Path path(package_path);

        std::string extension = path.extension();
        if (extension == "appxbundle" || extension == "msixbundle") {
            auto bundle = extractor.readBundleManifest(path);
            std::cout << "=== Bundle中的程序包 ===" << std::endl;
            for (const auto& entry : bundle.packages) {
                std::cout << "  " << entry.file_name << " [" << entry.type << "]";
                if (!entry.architecture.empty()) {
                    std::cout << " " << entry.architecture;
                }
                std::cout << std::endl;
            }
        }

        auto document = extractor.extract(path);
        EXAMPLE_INFO("Extracted manifest <{}> from {}", document.rootName(), package_path);

        std::cout << "\n=== 应用程序清单 ===" << std::endl;
        std::cout << document.toString() << std::endl;
    } catch (const appxmanifest::core::AppxManifestException& e) {
        EXAMPLE_ERROR("Extraction failed: {}", e.getDetailedMessage());
        std::cerr << "提取失败: " << e.getDetailedMessage() << std::endl;
        exit_code = 2;
    }

    appxmanifest::cleanup();
    return exit_code;
}
