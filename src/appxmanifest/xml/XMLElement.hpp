#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace appxmanifest {
namespace xml {

/**
 * @brief 简单的XML元素树节点
 *
 * 由XMLStreamReader::parseToDOM()构建。属性和子元素都保持文档顺序，
 * 元素名和属性名保留原始的命名空间前缀。
 *
 * 混合内容按位置保存：getTextContent()是第一个子元素之前的文本，
 * 每个子元素的getTail()是它结束标签之后、下一个兄弟之前的文本。
 * 例如 <a>x<b/>y</a> 中，a的文本为"x"，b的尾随文本为"y"。
 */
class XMLElement {
public:
    using Attribute = std::pair<std::string, std::string>;

    explicit XMLElement(std::string name) : name_(std::move(name)) {}

    XMLElement(const XMLElement&) = delete;
    XMLElement& operator=(const XMLElement&) = delete;

    const std::string& getName() const { return name_; }

    /**
     * @brief 不带前缀的元素名
     */
    std::string_view getLocalName() const;

    // 查找子元素
    XMLElement* findChild(std::string_view element_name) const;
    std::vector<XMLElement*> findChildren(std::string_view element_name) const;
    XMLElement* findChildByPath(std::string_view path) const;  // 支持路径查找如"child/grandchild"

    /**
     * @brief 按本地名查找（忽略命名空间前缀）
     */
    XMLElement* findChildByLocalName(std::string_view local_name) const;

    // 属性操作
    std::string getAttribute(std::string_view attr_name, const std::string& default_value = "") const;
    bool hasAttribute(std::string_view attr_name) const;
    void setAttribute(const std::string& attr_name, const std::string& value);
    const std::vector<Attribute>& getAttributes() const { return attributes_; }

    // 文本内容
    const std::string& getTextContent() const { return text_; }
    const std::string& getTail() const { return tail_; }

    /**
     * @brief 追加文本：没有子元素时属于本元素，否则成为最后一个子元素的尾随文本
     */
    void appendText(std::string_view text);

    // 子元素
    XMLElement* appendChild(std::unique_ptr<XMLElement> child);
    const std::vector<std::unique_ptr<XMLElement>>& getChildren() const { return children_; }
    size_t getChildCount() const { return children_.size(); }
    XMLElement* getParent() const { return parent_; }

    // 遍历辅助方法
    void forEachRecursive(const std::function<void(const XMLElement&, int)>& callback, int depth = 0) const;

    int getDepth() const;

    /**
     * @brief 序列化为XML文本，不添加任何空白，文本按原位置输出
     *
     * 不包含本元素自身的尾随文本。
     */
    std::string toString() const;

    /**
     * @brief 结构比较：名称、属性（含顺序）、文本、子元素及其尾随文本
     */
    bool operator==(const XMLElement& other) const;
    bool operator!=(const XMLElement& other) const { return !(*this == other); }

private:
    std::string name_;
    std::vector<Attribute> attributes_;
    std::string text_;
    std::string tail_;
    std::vector<std::unique_ptr<XMLElement>> children_;
    XMLElement* parent_ = nullptr;
};

}} // namespace appxmanifest::xml
