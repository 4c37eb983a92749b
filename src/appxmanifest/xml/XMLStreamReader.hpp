#pragma once

#include "appxmanifest/xml/XMLElement.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <expat.h>

namespace appxmanifest {
namespace xml {

/**
 * @brief 流式XML解析器，基于libexpat
 *
 * - SAX事件回调：开始元素、结束元素、文本
 * - 严格解析：任何良构性错误都会终止解析，不做容错恢复
 * - 回调中抛出的异常会终止解析并记录为CallbackError
 * - parseToDOM() 把小文档（清单）解析为XMLElement树
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败（XML不是良构的）
    MemoryError,           // 内存错误
    CallbackError          // 回调函数错误
};

// XML属性（仅在回调期间有效，引用expat内部缓冲区）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

class XMLStreamReader {
public:
    // 事件回调函数类型定义
    using StartElementCallback = std::function<void(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;
    using ErrorCallback = std::function<void(XMLParseError error, const std::string& message, int line, int column)>;

private:
    // libexpat解析器句柄
    XML_Parser parser_ = nullptr;

    // 解析状态
    bool is_parsing_ = false;
    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;
    int last_error_line_ = -1;
    int last_error_column_ = -1;

    // 属性缓存（每个开始元素复用）
    std::vector<XMLAttribute> attributes_;

    // 当前文本内容累积
    std::string current_text_;

    // 回调函数
    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    ErrorCallback error_callback_;

    // 解析选项
    bool trim_whitespace_ = true;
    bool namespace_aware_ = false;

    // 统计信息
    size_t bytes_parsed_ = 0;
    size_t elements_parsed_ = 0;

    // libexpat回调函数（静态）
    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);

    // 内部辅助方法
    bool initializeParser();
    void cleanupParser();
    void resetState();
    void flushText();
    std::string_view trimStringView(std::string_view str) const;
    void handleError(XMLParseError error, const std::string& message);
    void abortFromCallback(const char* where, const std::exception& e);

public:
    XMLStreamReader();
    ~XMLStreamReader();

    // 禁用拷贝构造和赋值
    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    // 回调函数设置
    void setStartElementCallback(StartElementCallback callback);
    void setEndElementCallback(EndElementCallback callback);
    void setTextCallback(TextCallback callback);
    void setErrorCallback(ErrorCallback callback);

    // 解析选项设置
    void setTrimWhitespace(bool trim);

    /**
     * @brief 命名空间感知模式：元素名和属性名形如 "namespace-uri|local"
     */
    void setNamespaceAware(bool aware);

    // 解析方法
    XMLParseError parseFromString(const std::string& xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    // 状态查询
    bool isParsing() const { return is_parsing_; }
    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    int getLastErrorLine() const { return last_error_line_; }
    int getLastErrorColumn() const { return last_error_column_; }
    size_t getBytesParsed() const { return bytes_parsed_; }
    size_t getElementsParsed() const { return elements_parsed_; }

    std::string getParserVersion() const;

    /**
     * @brief 把整个文档解析为元素树（适合小文档）
     * @return 失败返回nullptr，错误信息见getLastErrorMessage()
     */
    std::unique_ptr<XMLElement> parseToDOM(const char* buffer, size_t size);
    std::unique_ptr<XMLElement> parseToDOM(const std::string& xml_content);
};

/**
 * @brief 去掉命名空间部分，返回本地名
 *
 * 同时处理前缀形式 "prefix:Local" 和命名空间感知形式 "uri|Local"
 */
std::string_view localName(std::string_view qualified_name);

}} // namespace appxmanifest::xml
