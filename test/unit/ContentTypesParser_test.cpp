#include "appxmanifest/opc/ContentTypesParser.hpp"
#include "appxmanifest/core/Constants.hpp"
#include "appxmanifest/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <string>

namespace appxmanifest {
namespace opc {

class ContentTypesParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        appxmanifest::Logger::getInstance().initialize("logs/ContentTypesParser_test.log",
                                                       appxmanifest::Logger::Level::DEBUG,
                                                       false);
    }

    void TearDown() override {
        appxmanifest::Logger::getInstance().shutdown();
    }

    ContentTypesParser parser_;

    const std::string bundle_types_ = R"(<?xml version="1.0" encoding="UTF-8"?>
<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">
  <Default Extension="appx" ContentType="application/vnd.ms-appx"/>
  <Default Extension="XML" ContentType="application/xml"/>
  <Override PartName="/AppxMetadata/AppxBundleManifest.xml" ContentType="application/vnd.ms-appx.bundlemanifest+xml"/>
  <Override PartName="/AppxBlockMap.xml" ContentType="application/vnd.ms-appx.blockmap+xml"/>
  <Override PartName="/Assets/My%20Logo.png" ContentType="image/png"/>
</Types>)";
};

// 测试1: 基本解析
TEST_F(ContentTypesParserTest, ParsesDefaultsAndOverrides) {
    ASSERT_TRUE(parser_.parse(bundle_types_));
    EXPECT_FALSE(parser_.hasError());

    ASSERT_EQ(parser_.getDefaults().size(), 2u);
    EXPECT_EQ(parser_.getDefaults()[0].extension, "appx");
    EXPECT_EQ(parser_.getDefaults()[0].content_type, core::ContentType::kPackage);

    ASSERT_EQ(parser_.getOverrides().size(), 3u);
    EXPECT_EQ(parser_.getOverrides()[0].part_name, "/AppxMetadata/AppxBundleManifest.xml");
    // 原始PartName保持不变
    EXPECT_EQ(parser_.getOverrides()[2].part_name, "/Assets/My%20Logo.png");
}

// 测试2: Override优先于Default
TEST_F(ContentTypesParserTest, OverrideTakesPrecedence) {
    ASSERT_TRUE(parser_.parse(bundle_types_));

    EXPECT_EQ(parser_.getContentType("/AppxMetadata/AppxBundleManifest.xml"), core::ContentType::kBundleManifest);
    EXPECT_EQ(parser_.getContentType("/AppxMetadata/Other.xml"), "application/xml");
    EXPECT_EQ(parser_.getContentType("/Contoso_x64.appx"), core::ContentType::kPackage);
}

// 测试3: 部件名和扩展名不区分大小写，内容类型原样返回
TEST_F(ContentTypesParserTest, LookupIgnoresCase) {
    ASSERT_TRUE(parser_.parse(bundle_types_));

    EXPECT_EQ(parser_.getContentType("/appxmetadata/appxbundlemanifest.XML"), core::ContentType::kBundleManifest);
    EXPECT_EQ(parser_.findDefaultType("APPX"), core::ContentType::kPackage);
    EXPECT_EQ(parser_.findDefaultType("xml"), "application/xml");
    EXPECT_EQ(parser_.findOverrideType("/APPXBLOCKMAP.XML"), core::ContentType::kBlockMap);
}

TEST_F(ContentTypesParserTest, OverridePartNameIsPercentDecoded) {
    ASSERT_TRUE(parser_.parse(bundle_types_));
    EXPECT_EQ(parser_.getContentType("/Assets/My Logo.png"), "image/png");
}

TEST_F(ContentTypesParserTest, UnmappedPartReturnsEmpty) {
    ASSERT_TRUE(parser_.parse(bundle_types_));

    EXPECT_TRUE(parser_.getContentType("/readme.txt").empty());
    EXPECT_TRUE(parser_.getContentType("/LICENSE").empty());
    EXPECT_TRUE(parser_.getContentType("/folder.d/LICENSE").empty());
}

// 测试4: 重复扩展名保留第一个
TEST_F(ContentTypesParserTest, FirstDuplicateWins) {
    std::string xml = R"(<Types>
  <Default Extension="xml" ContentType="application/xml"/>
  <Default Extension="Xml" ContentType="text/xml"/>
</Types>)";
    ASSERT_TRUE(parser_.parse(xml));
    EXPECT_EQ(parser_.findDefaultType("xml"), "application/xml");
}

TEST_F(ContentTypesParserTest, IncompleteEntriesAreSkipped) {
    std::string xml = R"(<Types>
  <Default Extension="png"/>
  <Override ContentType="application/xml"/>
  <Default Extension="xml" ContentType="application/xml"/>
</Types>)";
    ASSERT_TRUE(parser_.parse(xml));
    EXPECT_EQ(parser_.getDefaults().size(), 1u);
    EXPECT_TRUE(parser_.getOverrides().empty());
}

// 只有Types的直接子元素参与映射
TEST_F(ContentTypesParserTest, NestedElementsAreIgnored) {
    std::string xml = R"(<Types>
  <Extra><Default Extension="png" ContentType="image/png"/></Extra>
</Types>)";
    ASSERT_TRUE(parser_.parse(xml));
    EXPECT_TRUE(parser_.getDefaults().empty());
}

// 测试5: 错误处理
TEST_F(ContentTypesParserTest, WrongRootElementFails) {
    EXPECT_FALSE(parser_.parse("<Relationships><Default Extension=\"xml\" ContentType=\"application/xml\"/></Relationships>"));
    EXPECT_TRUE(parser_.hasError());
    EXPECT_NE(parser_.getErrorMessage().find("Relationships"), std::string::npos);
}

TEST_F(ContentTypesParserTest, MalformedXmlFails) {
    EXPECT_FALSE(parser_.parse("<Types><Default Extension=\"xml\" ContentType=\"application/xml\"></Types>"));
    EXPECT_TRUE(parser_.hasError());
    EXPECT_GT(parser_.getErrorLine(), 0);
}

TEST_F(ContentTypesParserTest, EmptyInputFails) {
    EXPECT_FALSE(parser_.parse(std::string()));
    EXPECT_TRUE(parser_.hasError());
}

// 测试6: 重新解析会清空旧数据
TEST_F(ContentTypesParserTest, ReparseClearsPreviousState) {
    ASSERT_TRUE(parser_.parse(bundle_types_));
    ASSERT_TRUE(parser_.parse("<Types><Default Extension=\"png\" ContentType=\"image/png\"/></Types>"));

    EXPECT_EQ(parser_.getDefaults().size(), 1u);
    EXPECT_TRUE(parser_.getOverrides().empty());
    EXPECT_TRUE(parser_.getContentType("/AppxBlockMap.xml").empty());

    parser_.clear();
    EXPECT_TRUE(parser_.getDefaults().empty());
}

}} // namespace appxmanifest::opc
