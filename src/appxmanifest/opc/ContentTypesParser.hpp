#pragma once

#include "appxmanifest/xml/BaseSAXParser.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace appxmanifest {
namespace opc {

/**
 * @brief [Content_Types].xml 解析器 - 基于SAX流式解析
 *
 * 查找规则（OPC）：先按部件名查Override，再按扩展名查Default。
 * 部件名和扩展名的查找不区分ASCII大小写，返回的内容类型保持原样。
 */
class ContentTypesParser : public xml::BaseSAXParser {
public:
    struct DefaultType {
        std::string extension;     // 文件扩展名（不含点）
        std::string content_type;
    };

    struct OverrideType {
        std::string part_name;     // 部件URI，如 /AppxManifest.xml
        std::string content_type;
    };

    ContentTypesParser() = default;
    ~ContentTypesParser() override = default;

    /**
     * @brief 解析内容类型XML
     * @return 是否解析成功（XML良构且根元素为Types）
     */
    bool parse(const char* data, size_t size);
    bool parse(const std::string& xml_content) {
        return parse(xml_content.data(), xml_content.size());
    }

    const std::vector<DefaultType>& getDefaults() const { return defaults_; }
    const std::vector<OverrideType>& getOverrides() const { return overrides_; }

    /**
     * @brief 根据扩展名查找默认类型
     * @return 内容类型，未找到返回空字符串
     */
    std::string findDefaultType(std::string_view extension) const;

    /**
     * @brief 根据部件URI查找覆盖类型
     * @return 内容类型，未找到返回空字符串
     */
    std::string findOverrideType(std::string_view part_name) const;

    /**
     * @brief 获取部件的内容类型（优先检查覆盖，再检查默认）
     * @param part_name 已解码的部件URI
     * @return 内容类型，没有映射时返回空字符串
     */
    std::string getContentType(std::string_view part_name) const;

    void clear();

private:
    std::vector<DefaultType> defaults_;
    std::vector<OverrideType> overrides_;

    // 查找索引，键为小写（解析时同步构建）
    std::unordered_map<std::string, std::string> default_index_;
    std::unordered_map<std::string, std::string> override_index_;

    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
};

}} // namespace appxmanifest::opc
