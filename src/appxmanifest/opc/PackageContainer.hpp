#pragma once

#include "appxmanifest/archive/ZipReader.hpp"
#include "appxmanifest/core/ExtractOptions.hpp"
#include "appxmanifest/core/Path.hpp"
#include "appxmanifest/opc/PackagePart.hpp"
#include "appxmanifest/opc/PartStream.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace appxmanifest {
namespace opc {

/**
 * @brief 只读的程序包容器（OPC包）
 *
 * 打开时读取ZIP中央目录和[Content_Types].xml，为每个条目确定内容类型，
 * 之后按部件读取数据。容器由打开它的调用独占，close()或析构时释放。
 *
 * 失败：
 * - 路径不存在或不是普通文件：FileException (FileNotFound)
 * - 不是ZIP、缺少或无法解析[Content_Types].xml、部件没有内容类型：
 *   ContainerFormatException (ContainerFormatError)
 */
class PackageContainer {
public:
    ~PackageContainer();

    PackageContainer(const PackageContainer&) = delete;
    PackageContainer& operator=(const PackageContainer&) = delete;

    // ========== 打开 ==========

    /**
     * @brief 打开磁盘上的容器
     */
    static std::unique_ptr<PackageContainer> openFile(const core::Path& path,
                                                      const core::ExtractOptions& options = core::ExtractOptions());

    /**
     * @brief 打开内存中的容器，容器持有这些字节
     * @param name 用于日志和错误信息的名称
     */
    static std::unique_ptr<PackageContainer> openBuffer(std::vector<uint8_t> bytes,
                                                        const std::string& name,
                                                        const core::ExtractOptions& options = core::ExtractOptions());

    /**
     * @brief 把外层容器中的一个部件作为嵌套容器打开
     *
     * 部件数据读入内存，不写入磁盘。返回的容器不依赖外层容器，
     * 但调用方应先关闭嵌套容器再关闭外层容器。
     * @throws ContainerFormatException 部件超过max_nested_package_size（PartTooLarge）或不是合法容器
     */
    static std::unique_ptr<PackageContainer> openNested(PackageContainer& outer,
                                                        const PackagePart& part,
                                                        const core::ExtractOptions& options = core::ExtractOptions());

    // ========== 状态 ==========

    /**
     * @brief 关闭容器（幂等）。仍然打开的部件流会先被关闭。
     */
    void close() noexcept;

    bool isOpen() const;

    /**
     * @brief 按中央目录顺序排列的部件
     */
    const std::vector<PackagePart>& parts() const { return parts_; }

    const std::string& name() const { return name_; }

    const core::ExtractOptions& options() const { return options_; }

    // ========== 读取 ==========

    /**
     * @brief 打开部件的读取流
     * @throws ParameterException 容器已关闭或已有打开的流
     * @throws PartNotFoundException 部件不属于本容器
     */
    PartStream openPartStream(const PackagePart& part);

    bool hasOpenStream() const { return active_stream_ != nullptr; }

private:
    friend class PartStream;

    PackageContainer(std::unique_ptr<archive::ZipReader> reader,
                     std::string name,
                     const core::ExtractOptions& options);

    // 打开ZIP并建立部件表
    void load();
    void loadContentTypes();

    archive::ZipReader& reader() { return *reader_; }

    // 流的登记/注销（由PartStream调用）
    void attachStream(PartStream* stream) { active_stream_ = stream; }
    void detachStream(PartStream* stream) {
        if (active_stream_ == stream) active_stream_ = nullptr;
    }

    std::unique_ptr<archive::ZipReader> reader_;
    std::string name_;
    core::ExtractOptions options_;
    std::vector<PackagePart> parts_;
    PartStream* active_stream_ = nullptr;
};

}} // namespace appxmanifest::opc
