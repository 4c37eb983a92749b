#include "appxmanifest/xml/XMLStreamReader.hpp"
#include "appxmanifest/utils/ModuleLoggers.hpp"
#include <climits>
#include <cstring>
#include <fmt/format.h>

namespace appxmanifest {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attributes_.reserve(16);
    resetState();
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    // 编码由expat根据BOM和XML声明识别
    if (namespace_aware_) {
        parser_ = XML_ParserCreateNS(nullptr, '|');
    } else {
        parser_ = XML_ParserCreate(nullptr);
    }

    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);

    XML_DEBUG("XML parser initialized (namespace aware: {})", namespace_aware_);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    is_parsing_ = false;
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    last_error_line_ = -1;
    last_error_column_ = -1;
    attributes_.clear();
    current_text_.clear();
    bytes_parsed_ = 0;
    elements_parsed_ = 0;
}

// 回调函数设置
void XMLStreamReader::setStartElementCallback(StartElementCallback callback) {
    start_element_callback_ = std::move(callback);
}

void XMLStreamReader::setEndElementCallback(EndElementCallback callback) {
    end_element_callback_ = std::move(callback);
}

void XMLStreamReader::setTextCallback(TextCallback callback) {
    text_callback_ = std::move(callback);
}

void XMLStreamReader::setErrorCallback(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

void XMLStreamReader::setTrimWhitespace(bool trim) {
    trim_whitespace_ = trim;
}

void XMLStreamReader::setNamespaceAware(bool aware) {
    namespace_aware_ = aware;
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();

    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Empty XML document");
        return XMLParseError::InvalidInput;
    }

    if (size > static_cast<size_t>(INT_MAX)) {
        handleError(XMLParseError::InvalidInput, fmt::format("XML document too large: {} bytes", size));
        return XMLParseError::InvalidInput;
    }

    if (!initializeParser()) {
        return last_error_;
    }

    is_parsing_ = true;
    bytes_parsed_ = size;

    // 使用ParseBuffer API
    void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(size));
    if (!expat_buffer) {
        handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
        is_parsing_ = false;
        cleanupParser();
        return XMLParseError::MemoryError;
    }

    std::memcpy(expat_buffer, buffer, size);

    if (XML_ParseBuffer(parser_, static_cast<int>(size), 1) == XML_STATUS_ERROR) {
        // 回调异常已经记录了CallbackError，这里不覆盖
        if (last_error_ == XMLParseError::Ok) {
            last_error_line_ = static_cast<int>(XML_GetCurrentLineNumber(parser_));
            last_error_column_ = static_cast<int>(XML_GetCurrentColumnNumber(parser_));
            std::string error_msg = fmt::format("Parse error at line {}, column {}: {}",
                last_error_line_,
                last_error_column_,
                XML_ErrorString(XML_GetErrorCode(parser_)));
            handleError(XMLParseError::ParseFailed, error_msg);
        }
        is_parsing_ = false;
        cleanupParser();
        return last_error_;
    }

    is_parsing_ = false;
    cleanupParser();
    XML_DEBUG("Successfully parsed {} bytes, {} elements", bytes_parsed_, elements_parsed_);
    return XMLParseError::Ok;
}

std::string XMLStreamReader::getParserVersion() const {
    return XML_ExpatVersion();
}

// libexpat回调函数实现
void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    // 子元素之前的文本属于父元素
    reader->flushText();

    std::string_view element_name{name, std::strlen(name)};
    reader->elements_parsed_++;

    reader->attributes_.clear();
    if (attrs) {
        for (int i = 0; attrs[i]; i += 2) {
            if (attrs[i + 1]) {
                reader->attributes_.emplace_back(
                    std::string_view{attrs[i], std::strlen(attrs[i])},
                    std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
            }
        }
    }

    APPXMANIFEST_LOG_XML_EVENT_DEBUG("Start element: {} at depth {}", element_name, reader->current_depth_);

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, reader->attributes_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortFromCallback("Start element", e);
            return;
        }
    }

    reader->current_depth_++;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    reader->flushText();
    reader->current_depth_--;

    std::string_view element_name{name, std::strlen(name)};

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortFromCallback("End element", e);
        }
    }
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

// 把累积的文本交给回调（深度为所属元素的深度）
void XMLStreamReader::flushText() {
    if (current_text_.empty()) {
        return;
    }

    std::string_view text_content = trim_whitespace_ ?
        trimStringView(current_text_) : std::string_view{current_text_};

    if (!text_content.empty() && text_callback_) {
        try {
            text_callback_(text_content, current_depth_ - 1);
        } catch (const std::exception& e) {
            current_text_.clear();
            abortFromCallback("Text", e);
            return;
        }
    }

    current_text_.clear();
}

// 字符串视图trim方法（零拷贝）
std::string_view XMLStreamReader::trimStringView(std::string_view str) const {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return std::string_view{};
    }

    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::abortFromCallback(const char* where, const std::exception& e) {
    if (parser_) {
        last_error_line_ = static_cast<int>(XML_GetCurrentLineNumber(parser_));
        last_error_column_ = static_cast<int>(XML_GetCurrentColumnNumber(parser_));
    }
    handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", where, e.what()));
    if (parser_) {
        XML_StopParser(parser_, XML_FALSE);
    }
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;

    XML_ERROR("XML parse error: {}", message);

    if (error_callback_) {
        error_callback_(error, message, last_error_line_, last_error_column_);
    }
}

// DOM解析实现
std::unique_ptr<XMLElement> XMLStreamReader::parseToDOM(const char* buffer, size_t size) {
    std::unique_ptr<XMLElement> root;
    std::vector<XMLElement*> element_stack;

    setStartElementCallback([&](std::string_view element_name, const std::vector<XMLAttribute>& attributes, int /*depth*/) {
        auto element = std::make_unique<XMLElement>(std::string(element_name));

        // DOM需要保存数据，这里拷贝属性（保持文档顺序）
        for (const auto& attr : attributes) {
            element->setAttribute(std::string(attr.name), std::string(attr.value));
        }

        XMLElement* element_ptr = element.get();
        if (element_stack.empty()) {
            root = std::move(element);
        } else {
            element_stack.back()->appendChild(std::move(element));
        }
        element_stack.push_back(element_ptr);
    });

    setEndElementCallback([&](std::string_view /*element_name*/, int /*depth*/) {
        if (!element_stack.empty()) {
            element_stack.pop_back();
        }
    });

    setTextCallback([&](std::string_view text, int /*depth*/) {
        if (!element_stack.empty()) {
            element_stack.back()->appendText(text);
        }
    });

    XMLParseError result = parseFromBuffer(buffer, size);

    // 回调引用了局部变量，解析结束后立即解除
    setStartElementCallback(nullptr);
    setEndElementCallback(nullptr);
    setTextCallback(nullptr);

    if (result != XMLParseError::Ok) {
        XML_ERROR("Failed to parse XML to DOM: {}", last_error_message_);
        return nullptr;
    }

    return root;
}

std::unique_ptr<XMLElement> XMLStreamReader::parseToDOM(const std::string& xml_content) {
    return parseToDOM(xml_content.data(), xml_content.size());
}

std::string_view localName(std::string_view qualified_name) {
    size_t pos = qualified_name.rfind('|');
    if (pos == std::string_view::npos) {
        pos = qualified_name.rfind(':');
    }
    return pos == std::string_view::npos ? qualified_name : qualified_name.substr(pos + 1);
}

}} // namespace appxmanifest::xml
