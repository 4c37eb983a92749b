#pragma once

#include "appxmanifest/manifest/BundleManifest.hpp"
#include "appxmanifest/xml/BaseSAXParser.hpp"
#include <string>

namespace appxmanifest {
namespace manifest {

/**
 * @brief Bundle清单（AppxBundleManifest.xml）解析器 - 基于SAX流式解析
 *
 * 结构：根元素Bundle，子元素Identity和Packages，Packages下为Package条目。
 * 元素名按本地名匹配，命名空间前缀被忽略。只有Bundle/Packages的直接子元素
 * Package才计为条目。
 */
class BundleManifestParser : public xml::BaseSAXParser {
public:
    BundleManifestParser() = default;
    ~BundleManifestParser() override = default;

    /**
     * @brief 解析Bundle清单
     * @return 是否解析成功（XML良构且根元素为Bundle）
     */
    bool parse(const char* data, size_t size);
    bool parse(const std::string& xml_content) {
        return parse(xml_content.data(), xml_content.size());
    }

    const BundleManifest& getManifest() const { return manifest_; }

    /**
     * @brief 取出解析结果
     */
    BundleManifest takeManifest() { return std::move(manifest_); }

private:
    BundleManifest manifest_;

    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;

    std::optional<uint64_t> findUInt64Attribute(const std::vector<xml::XMLAttribute>& attributes, std::string_view name) const;
};

}} // namespace appxmanifest::manifest
