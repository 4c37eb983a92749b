#include "appxmanifest/xml/XMLElement.hpp"
#include "appxmanifest/xml/XMLStreamReader.hpp"
#include <algorithm>

namespace appxmanifest {
namespace xml {

namespace {

// 转义文本和属性值中的特殊字符
// 属性值里的空白字符用字符引用输出，否则重新解析时会被规范化为空格
void appendEscaped(std::string& out, std::string_view text, bool attribute) {
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '\r': out += "&#13;"; break;
            case '"':
                out += attribute ? "&quot;" : "\"";
                break;
            case '\n':
                out += attribute ? "&#10;" : "\n";
                break;
            case '\t':
                out += attribute ? "&#9;" : "\t";
                break;
            default: out += c; break;
        }
    }
}

} // namespace

std::string_view XMLElement::getLocalName() const {
    return localName(name_);
}

XMLElement* XMLElement::findChild(std::string_view element_name) const {
    for (const auto& child : children_) {
        if (child->name_ == element_name) {
            return child.get();
        }
    }
    return nullptr;
}

std::vector<XMLElement*> XMLElement::findChildren(std::string_view element_name) const {
    std::vector<XMLElement*> result;
    for (const auto& child : children_) {
        if (child->name_ == element_name) {
            result.push_back(child.get());
        }
    }
    return result;
}

XMLElement* XMLElement::findChildByPath(std::string_view path) const {
    if (path.empty()) return nullptr;

    size_t pos = path.find('/');
    if (pos == std::string_view::npos) {
        return findChild(path);
    }

    XMLElement* child = findChild(path.substr(0, pos));
    if (child) {
        return child->findChildByPath(path.substr(pos + 1));
    }
    return nullptr;
}

XMLElement* XMLElement::findChildByLocalName(std::string_view local_name) const {
    for (const auto& child : children_) {
        if (child->getLocalName() == local_name) {
            return child.get();
        }
    }
    return nullptr;
}

std::string XMLElement::getAttribute(std::string_view attr_name, const std::string& default_value) const {
    auto it = std::find_if(attributes_.begin(), attributes_.end(),
                           [attr_name](const Attribute& attr) { return attr.first == attr_name; });
    return it != attributes_.end() ? it->second : default_value;
}

bool XMLElement::hasAttribute(std::string_view attr_name) const {
    return std::any_of(attributes_.begin(), attributes_.end(),
                       [attr_name](const Attribute& attr) { return attr.first == attr_name; });
}

void XMLElement::setAttribute(const std::string& attr_name, const std::string& value) {
    for (auto& attr : attributes_) {
        if (attr.first == attr_name) {
            attr.second = value;
            return;
        }
    }
    attributes_.emplace_back(attr_name, value);
}

void XMLElement::appendText(std::string_view text) {
    std::string& target = children_.empty() ? text_ : children_.back()->tail_;
    target.append(text.data(), text.size());
}

XMLElement* XMLElement::appendChild(std::unique_ptr<XMLElement> child) {
    XMLElement* child_ptr = child.get();
    child_ptr->parent_ = this;
    children_.push_back(std::move(child));
    return child_ptr;
}

void XMLElement::forEachRecursive(const std::function<void(const XMLElement&, int)>& callback, int depth) const {
    callback(*this, depth);
    for (const auto& child : children_) {
        child->forEachRecursive(callback, depth + 1);
    }
}

int XMLElement::getDepth() const {
    int depth = 0;
    const XMLElement* current = parent_;
    while (current) {
        depth++;
        current = current->parent_;
    }
    return depth;
}

namespace {

void serialize(const XMLElement& element, std::string& out) {
    out += '<';
    out += element.getName();
    for (const auto& attr : element.getAttributes()) {
        out += ' ';
        out += attr.first;
        out += "=\"";
        appendEscaped(out, attr.second, true);
        out += '"';
    }

    if (element.getTextContent().empty() && element.getChildren().empty()) {
        out += "/>";
        return;
    }

    out += '>';
    appendEscaped(out, element.getTextContent(), false);
    for (const auto& child : element.getChildren()) {
        serialize(*child, out);
        appendEscaped(out, child->getTail(), false);
    }
    out += "</";
    out += element.getName();
    out += '>';
}

} // namespace

std::string XMLElement::toString() const {
    std::string result;
    serialize(*this, result);
    return result;
}

bool XMLElement::operator==(const XMLElement& other) const {
    if (name_ != other.name_ || text_ != other.text_ ||
        attributes_ != other.attributes_ || children_.size() != other.children_.size()) {
        return false;
    }
    for (size_t i = 0; i < children_.size(); ++i) {
        if (children_[i]->tail_ != other.children_[i]->tail_ || *children_[i] != *other.children_[i]) {
            return false;
        }
    }
    return true;
}

}} // namespace appxmanifest::xml
