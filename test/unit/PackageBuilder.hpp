#pragma once

#include "appxmanifest/core/Constants.hpp"
#include <mz.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace appxmanifest {
namespace test {

/**
 * @brief 测试用程序包生成器（minizip-ng写入接口）
 *
 * 按添加顺序写入条目，[Content_Types].xml 总是第一个条目。
 */
class PackageBuilder {
public:
    PackageBuilder& addDefault(const std::string& extension, const std::string& content_type) {
        defaults_.emplace_back(extension, content_type);
        return *this;
    }

    PackageBuilder& addOverride(const std::string& part_name, const std::string& content_type) {
        overrides_.emplace_back(part_name, content_type);
        return *this;
    }

    PackageBuilder& addEntry(const std::string& entry_name, const std::string& data) {
        entries_.emplace_back(entry_name, std::vector<uint8_t>(data.begin(), data.end()));
        return *this;
    }

    PackageBuilder& addEntry(const std::string& entry_name, const std::vector<uint8_t>& data) {
        entries_.emplace_back(entry_name, data);
        return *this;
    }

    /**
     * @brief 不写入[Content_Types].xml
     */
    PackageBuilder& withoutContentTypes() {
        write_content_types_ = false;
        return *this;
    }

    /**
     * @brief 用自定义文本替换生成的[Content_Types].xml
     */
    PackageBuilder& withRawContentTypes(const std::string& xml) {
        raw_content_types_ = xml;
        return *this;
    }

    PackageBuilder& storeOnly() {
        compress_method_ = MZ_COMPRESS_METHOD_STORE;
        return *this;
    }

    std::string contentTypesXml() const {
        if (!raw_content_types_.empty()) {
            return raw_content_types_;
        }
        std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n"
                          "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">";
        for (const auto& def : defaults_) {
            xml += "<Default Extension=\"" + def.first + "\" ContentType=\"" + def.second + "\"/>";
        }
        for (const auto& ovr : overrides_) {
            xml += "<Override PartName=\"" + ovr.first + "\" ContentType=\"" + ovr.second + "\"/>";
        }
        xml += "</Types>";
        return xml;
    }

    /**
     * @brief 写入ZIP文件，失败时抛出std::runtime_error
     */
    void writeTo(const std::string& path) const {
        void* writer = mz_zip_writer_create();
        if (!writer) {
            throw std::runtime_error("mz_zip_writer_create failed");
        }

        mz_zip_writer_set_compress_method(writer, compress_method_);

        int32_t err = mz_zip_writer_open_file(writer, path.c_str(), 0, 0);
        if (err != MZ_OK) {
            mz_zip_writer_delete(&writer);
            throw std::runtime_error("mz_zip_writer_open_file failed: " + path);
        }

        if (write_content_types_) {
            std::string types = contentTypesXml();
            err = addBuffer(writer, core::kContentTypesEntry, types.data(), types.size());
        }

        for (const auto& entry : entries_) {
            if (err != MZ_OK) break;
            err = addBuffer(writer, entry.first, entry.second.data(), entry.second.size());
        }

        int32_t close_err = mz_zip_writer_close(writer);
        mz_zip_writer_delete(&writer);

        if (err != MZ_OK || close_err != MZ_OK) {
            throw std::runtime_error("Failed to write test package: " + path);
        }
    }

    /**
     * @brief 生成ZIP字节（借助临时文件）
     */
    std::vector<uint8_t> build(const std::string& scratch_path) const {
        writeTo(scratch_path);
        return readFile(scratch_path);
    }

    static std::vector<uint8_t> readFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Cannot read " + path);
        }
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    static void writeFile(const std::string& path, const std::string& data) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }

private:
    std::vector<std::pair<std::string, std::string>> defaults_;
    std::vector<std::pair<std::string, std::string>> overrides_;
    std::vector<std::pair<std::string, std::vector<uint8_t>>> entries_;
    bool write_content_types_ = true;
    std::string raw_content_types_;
    uint16_t compress_method_ = MZ_COMPRESS_METHOD_DEFLATE;

    int32_t addBuffer(void* writer, const std::string& name, const void* data, size_t size) const {
        mz_zip_file file_info = {};
        file_info.filename = name.c_str();
        file_info.uncompressed_size = static_cast<int64_t>(size);
        file_info.compression_method = compress_method_;
        file_info.modified_date = std::time(nullptr);
        file_info.version_madeby = (MZ_HOST_SYSTEM_UNIX << 8) | 20;

        static char empty = 0;
        void* buffer = size > 0 ? const_cast<void*>(data) : static_cast<void*>(&empty);
        return mz_zip_writer_add_buffer(writer, buffer, static_cast<int32_t>(size), &file_info);
    }
};

// ========== 常用清单与程序包 ==========

inline std::string sampleManifestXml(const std::string& identity_name = "Contoso.App",
                                     const std::string& architecture = "x64") {
    return "<?xml version=\"1.0\" encoding=\"utf-8\"?>\r\n"
           "<Package xmlns=\"http://schemas.microsoft.com/appx/manifest/foundation/windows10\" "
           "xmlns:uap=\"http://schemas.microsoft.com/appx/manifest/uap/windows10\" IgnorableNamespaces=\"uap\">\r\n"
           "  <Identity Name=\"" + identity_name + "\" Publisher=\"CN=Contoso\" Version=\"1.2.3.0\" "
           "ProcessorArchitecture=\"" + architecture + "\"/>\r\n"
           "  <Properties>\r\n"
           "    <DisplayName>Contoso App</DisplayName>\r\n"
           "    <PublisherDisplayName>Contoso &amp; Co</PublisherDisplayName>\r\n"
           "  </Properties>\r\n"
           "  <Applications>\r\n"
           "    <Application Id=\"App\" Executable=\"App.exe\">\r\n"
           "      <uap:VisualElements DisplayName=\"Contoso\" Square150x150Logo=\"Assets\\Logo.png\"/>\r\n"
           "    </Application>\r\n"
           "  </Applications>\r\n"
           "</Package>\r\n";
}

/**
 * @brief 单个程序包：清单、块映射和一个资源文件
 */
inline PackageBuilder appxPackage(const std::string& manifest_xml) {
    PackageBuilder builder;
    builder.addDefault("png", "image/png")
           .addDefault("xml", "application/xml")
           .addOverride("/AppxManifest.xml", core::ContentType::kAppxManifest)
           .addOverride("/AppxBlockMap.xml", core::ContentType::kBlockMap)
           .addEntry("AppxManifest.xml", manifest_xml)
           .addEntry("Assets/Logo.png", std::string("\x89PNG\r\n\x1a\n", 8))
           .addEntry("AppxBlockMap.xml", "<?xml version=\"1.0\"?><BlockMap/>");
    return builder;
}

struct BundleEntrySpec {
    std::string file_name;
    std::string type;
    std::string architecture;
};

inline std::string bundleManifestXml(const std::vector<BundleEntrySpec>& entries) {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n"
                      "<Bundle xmlns=\"http://schemas.microsoft.com/appx/2013/bundle\" SchemaVersion=\"3.0\">\r\n"
                      "  <Identity Name=\"Contoso.App\" Publisher=\"CN=Contoso\" Version=\"1.2.3.0\"/>\r\n"
                      "  <Packages>\r\n";
    uint64_t offset = 100;
    for (const auto& entry : entries) {
        xml += "    <Package Type=\"" + entry.type + "\" Version=\"1.2.3.0\"";
        if (!entry.architecture.empty()) {
            xml += " Architecture=\"" + entry.architecture + "\"";
        }
        xml += " FileName=\"" + entry.file_name + "\" Offset=\"" + std::to_string(offset) + "\" Size=\"2048\"/>\r\n";
        offset += 2048;
    }
    xml += "  </Packages>\r\n</Bundle>\r\n";
    return xml;
}

/**
 * @brief Bundle：Bundle清单加上若干嵌套程序包
 * @param packages 嵌套程序包的条目名和字节
 */
inline PackageBuilder appxBundle(const std::string& bundle_manifest_xml,
                                 const std::vector<std::pair<std::string, std::vector<uint8_t>>>& packages) {
    PackageBuilder builder;
    builder.addDefault("appx", core::ContentType::kPackage)
           .addDefault("xml", "application/xml")
           .addOverride("/AppxMetadata/AppxBundleManifest.xml", core::ContentType::kBundleManifest)
           .addOverride("/AppxBlockMap.xml", core::ContentType::kBlockMap)
           .addEntry("AppxMetadata/AppxBundleManifest.xml", bundle_manifest_xml);
    for (const auto& package : packages) {
        builder.addEntry(package.first, package.second);
    }
    builder.addEntry("AppxBlockMap.xml", "<?xml version=\"1.0\"?><BlockMap/>");
    return builder;
}

}} // namespace appxmanifest::test
