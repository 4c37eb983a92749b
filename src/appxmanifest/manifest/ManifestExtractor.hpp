#pragma once

#include "appxmanifest/core/ExtractOptions.hpp"
#include "appxmanifest/core/Path.hpp"
#include "appxmanifest/manifest/BundleManifest.hpp"
#include "appxmanifest/manifest/ManifestDocument.hpp"
#include "appxmanifest/opc/PackageContainer.hpp"

namespace appxmanifest {
namespace manifest {

/**
 * @brief 从程序包或Bundle中提取应用程序清单
 *
 * 除选项外无状态。每次调用自己打开并关闭所需的容器，
 * 任何失败都以AppxManifestException子类抛出，容器在栈展开时释放。
 *
 * 使用示例：
 * @code
 * manifest::ManifestExtractor extractor;
 * manifest::ManifestDocument doc = extractor.extract(core::Path("app.appxbundle"));
 * std::cout << doc.toString();
 * @endcode
 */
class ManifestExtractor {
public:
    explicit ManifestExtractor(const core::ExtractOptions& options = core::ExtractOptions());

    /**
     * @brief 从单个程序包提取清单
     * @throws FileException 路径不存在
     * @throws ContainerFormatException 不是合法容器
     * @throws PartNotFoundException 没有清单部件
     * @throws XMLException 清单不是良构的XML
     */
    ManifestDocument extractFromPackage(const core::Path& path) const;

    /**
     * @brief 从Bundle提取主程序包的清单
     *
     * 读取Bundle清单，取第一个Type为Application的程序包，
     * 把它作为内存中的嵌套容器打开，再提取其中的清单。
     * @throws MainPackageNotFoundException Bundle清单中没有Application程序包
     * @throws PartNotFoundException 缺少Bundle清单或被引用的程序包
     */
    ManifestDocument extractFromBundle(const core::Path& path) const;

    /**
     * @brief 自动识别：容器中有Bundle清单时按Bundle处理，否则按单个程序包处理
     */
    ManifestDocument extract(const core::Path& path) const;

    /**
     * @brief 读取Bundle清单的全部条目
     */
    BundleManifest readBundleManifest(const core::Path& path) const;

    /**
     * @brief 从已经打开的容器中提取清单（不关闭容器）
     */
    ManifestDocument extractFromContainer(opc::PackageContainer& container) const;

    const core::ExtractOptions& options() const { return options_; }

private:
    core::ExtractOptions options_;

    BundleManifest parseBundleManifest(opc::PackageContainer& bundle) const;
    ManifestDocument extractFromBundleContainer(opc::PackageContainer& bundle) const;
    std::string readXmlPart(opc::PackageContainer& container, const opc::PackagePart& part) const;
};

}} // namespace appxmanifest::manifest
