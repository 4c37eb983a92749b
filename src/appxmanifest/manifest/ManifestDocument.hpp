#pragma once

#include "appxmanifest/xml/XMLElement.hpp"
#include <memory>
#include <string>

namespace appxmanifest {
namespace manifest {

/**
 * @brief 解析后的清单文档（元素树）
 *
 * 内容对本库不透明：元素名、属性（含xmlns声明）、文本和子元素按文档原样保存，
 * 文本中的空白不做裁剪。
 *
 * 被移动后的文档为空：root()、rootName()和toString()抛出ParameterException。
 */
class ManifestDocument {
public:
    /**
     * @brief 严格解析XML文本
     * @param source 用于错误信息的来源（部件URI）
     * @throws XMLException 文档不是良构的XML
     */
    static ManifestDocument parse(const std::string& xml_content, const std::string& source = "");

    ManifestDocument(ManifestDocument&&) noexcept = default;
    ManifestDocument& operator=(ManifestDocument&&) noexcept = default;

    ManifestDocument(const ManifestDocument&) = delete;
    ManifestDocument& operator=(const ManifestDocument&) = delete;

    bool empty() const { return !root_; }

    const xml::XMLElement& root() const;

    /**
     * @brief 根元素名（保留前缀）
     */
    const std::string& rootName() const { return root().getName(); }

    std::string toString() const { return root().toString(); }

    // 两个空文档相等
    bool operator==(const ManifestDocument& other) const;
    bool operator!=(const ManifestDocument& other) const { return !(*this == other); }

private:
    explicit ManifestDocument(std::unique_ptr<xml::XMLElement> root) : root_(std::move(root)) {}

    std::unique_ptr<xml::XMLElement> root_;
};

}} // namespace appxmanifest::manifest
