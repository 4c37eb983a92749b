#pragma once

#include "appxmanifest/opc/PackagePart.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace appxmanifest {
namespace opc {

class PackageContainer;

/**
 * @brief 单个部件的只读流（RAII）
 *
 * 由PackageContainer::openPartStream()创建，析构时自动关闭。
 * 同一容器同一时刻只能打开一个流；容器关闭时会先关闭仍然打开的流。
 */
class PartStream {
public:
    ~PartStream();

    PartStream(const PartStream&) = delete;
    PartStream& operator=(const PartStream&) = delete;

    PartStream(PartStream&& other) noexcept;
    PartStream& operator=(PartStream&& other) noexcept;

    /**
     * @brief 读取最多size字节
     * @return 实际读取的字节数，0表示部件已读完
     * @throws ParameterException 流已关闭
     * @throws ContainerFormatException 压缩数据损坏
     * @throws FileException 底层读取失败
     */
    size_t read(void* buffer, size_t size);

    /**
     * @brief 读取剩余的全部数据并关闭流，关闭时校验CRC
     * @param max_size 允许的最大字节数
     * @throws ContainerFormatException 超过max_size（PartTooLarge）或数据损坏
     */
    std::vector<uint8_t> readAll(uint64_t max_size = UINT64_MAX);

    /**
     * @brief 同readAll()，以文本形式返回（不做编码转换）
     */
    std::string readAllText(uint64_t max_size = UINT64_MAX);

    /**
     * @brief 关闭流（幂等，不抛出异常）
     */
    void close() noexcept;

    bool isOpen() const { return container_ != nullptr; }

    const PackagePart& part() const { return *part_; }

    uint64_t bytesRead() const { return bytes_read_; }

private:
    friend class PackageContainer;

    PartStream(PackageContainer& container, const PackagePart& part, size_t buffer_size);

    // 读完后关闭条目并校验，失败时抛出
    void finish();

    PackageContainer* container_ = nullptr;
    const PackagePart* part_ = nullptr;
    size_t buffer_size_ = 0;
    uint64_t bytes_read_ = 0;
    bool at_end_ = false;
};

}} // namespace appxmanifest::opc
