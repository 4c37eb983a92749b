#pragma once

#include "appxmanifest/xml/XMLStreamReader.hpp"
#include "appxmanifest/utils/ModuleLoggers.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace appxmanifest {
namespace xml {

/**
 * @brief 通用SAX解析器基类
 *
 * 封装XMLStreamReader的回调注册和错误收集，子类只处理元素事件。
 * 元素栈保存的是本地名（去掉命名空间前缀），子类按本地名匹配即可。
 */
class BaseSAXParser {
protected:
    // 通用解析状态
    struct ParseState {
        // 元素栈用于跟踪嵌套结构（本地名）
        std::vector<std::string> element_stack;

        // 错误状态
        bool has_error = false;
        std::string error_message;
        int error_line = -1;

        void reset() {
            element_stack.clear();
            has_error = false;
            error_message.clear();
            error_line = -1;
        }

        // 父元素的本地名（当前元素之前的栈顶）
        std::string_view getParentElement() const {
            return element_stack.size() < 2 ? std::string_view{} : std::string_view{element_stack[element_stack.size() - 2]};
        }
    };

    ParseState state_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @return 是否解析成功，失败原因见getErrorMessage()
     */
    bool parseXML(const char* data, size_t size) {
        state_.reset();

        if (!data || size == 0) {
            setError("Empty XML content");
            return false;
        }

        XMLStreamReader reader;

        reader.setStartElementCallback([this](std::string_view name, const std::vector<XMLAttribute>& attributes, int depth) {
            state_.element_stack.emplace_back(localName(name));
            onStartElement(localName(name), attributes, depth);
        });

        reader.setEndElementCallback([this](std::string_view name, int depth) {
            onEndElement(localName(name), depth);
            if (!state_.element_stack.empty()) {
                state_.element_stack.pop_back();
            }
        });

        reader.setTextCallback([this](std::string_view text, int depth) {
            onText(text, depth);
        });

        reader.setErrorCallback([this](XMLParseError /*error*/, const std::string& message, int line, int /*column*/) {
            state_.has_error = true;
            state_.error_message = message;
            state_.error_line = line;
        });

        XMLParseError result = reader.parseFromBuffer(data, size);
        if (result != XMLParseError::Ok) {
            if (!state_.has_error) {
                state_.has_error = true;
                state_.error_message = "XML parsing failed";
            }
            return false;
        }

        return !state_.has_error;
    }

    bool parseXML(const std::string& xml_content) {
        return parseXML(xml_content.data(), xml_content.size());
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }
    int getErrorLine() const { return state_.error_line; }

protected:
    // 子类重写的事件处理（name为本地名）
    virtual void onStartElement(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth) = 0;
    virtual void onEndElement(std::string_view /*name*/, int /*depth*/) {}
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    /**
     * @brief 按属性名查找（属性名精确匹配）
     */
    std::optional<std::string> findAttribute(const std::vector<XMLAttribute>& attributes, std::string_view name) const {
        for (const auto& attr : attributes) {
            if (attr.name == name) {
                return std::string(attr.value);
            }
        }
        return std::nullopt;
    }

    std::string getAttributeOr(const std::vector<XMLAttribute>& attributes, std::string_view name, const std::string& default_value) const {
        auto val = findAttribute(attributes, name);
        return val ? *val : default_value;
    }

    /**
     * @brief 记录语义错误，parseXML()结束后返回false
     */
    void setError(const std::string& message) {
        state_.has_error = true;
        state_.error_message = message;
        XML_ERROR("Parser error: {}", message);
    }

    std::string_view getParentElement() const {
        return state_.getParentElement();
    }
};

}} // namespace appxmanifest::xml
