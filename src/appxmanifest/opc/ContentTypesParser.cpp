#include "appxmanifest/opc/ContentTypesParser.hpp"
#include "appxmanifest/utils/CommonUtils.hpp"
#include "appxmanifest/utils/ModuleLoggers.hpp"

namespace appxmanifest {
namespace opc {

bool ContentTypesParser::parse(const char* data, size_t size) {
    clear();
    return parseXML(data, size);
}

void ContentTypesParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) {
    if (depth == 0) {
        if (name != "Types") {
            setError("Unexpected root element in content types: " + std::string(name));
        }
        return;
    }

    // 只处理Types的直接子元素
    if (depth != 1) {
        return;
    }

    if (name == "Default") {
        auto extension = findAttribute(attributes, "Extension");
        auto content_type = findAttribute(attributes, "ContentType");

        if (extension && content_type && !extension->empty() && !content_type->empty()) {
            // 重复的扩展名只保留第一个
            default_index_.emplace(utils::CommonUtils::toLowerAscii(*extension), *content_type);
            defaults_.push_back(DefaultType{std::move(*extension), std::move(*content_type)});

            OPC_DEBUG("Parsed default type: .{} -> {}", defaults_.back().extension, defaults_.back().content_type);
        } else {
            OPC_WARN("Skipping incomplete default type: extension='{}', contentType='{}'",
                     extension ? *extension : "", content_type ? *content_type : "");
        }
    }
    else if (name == "Override") {
        auto part_name = findAttribute(attributes, "PartName");
        auto content_type = findAttribute(attributes, "ContentType");

        if (part_name && content_type && !part_name->empty() && !content_type->empty()) {
            // PartName本身可能是百分号编码的URI，按解码后的形式建索引
            std::string key = utils::CommonUtils::toLowerAscii(utils::CommonUtils::percentDecode(*part_name));
            override_index_.emplace(std::move(key), *content_type);
            overrides_.push_back(OverrideType{std::move(*part_name), std::move(*content_type)});

            OPC_DEBUG("Parsed override type: {} -> {}", overrides_.back().part_name, overrides_.back().content_type);
        } else {
            OPC_WARN("Skipping incomplete override type: partName='{}', contentType='{}'",
                     part_name ? *part_name : "", content_type ? *content_type : "");
        }
    }
}

std::string ContentTypesParser::findDefaultType(std::string_view extension) const {
    auto it = default_index_.find(utils::CommonUtils::toLowerAscii(extension));
    return (it != default_index_.end()) ? it->second : std::string();
}

std::string ContentTypesParser::findOverrideType(std::string_view part_name) const {
    auto it = override_index_.find(utils::CommonUtils::toLowerAscii(part_name));
    return (it != override_index_.end()) ? it->second : std::string();
}

std::string ContentTypesParser::getContentType(std::string_view part_name) const {
    std::string content_type = findOverrideType(part_name);
    if (!content_type.empty()) {
        return content_type;
    }

    std::string_view extension = utils::CommonUtils::extensionOf(part_name);
    if (!extension.empty()) {
        return findDefaultType(extension);
    }

    return std::string();
}

void ContentTypesParser::clear() {
    defaults_.clear();
    overrides_.clear();
    default_index_.clear();
    override_index_.clear();
}

}} // namespace appxmanifest::opc
