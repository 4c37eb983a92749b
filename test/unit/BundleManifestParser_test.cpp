#include "appxmanifest/manifest/BundleManifestParser.hpp"
#include "appxmanifest/utils/Logger.hpp"
#include "PackageBuilder.hpp"
#include <gtest/gtest.h>
#include <string>

namespace appxmanifest {
namespace manifest {

class BundleManifestParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        appxmanifest::Logger::getInstance().initialize("logs/BundleManifestParser_test.log",
                                                       appxmanifest::Logger::Level::DEBUG,
                                                       false);
    }

    void TearDown() override {
        appxmanifest::Logger::getInstance().shutdown();
    }

    BundleManifestParser parser_;
};

// 测试1: 条目按文档顺序读取
TEST_F(BundleManifestParserTest, ParsesPackagesInDocumentOrder) {
    std::string xml = R"(<?xml version="1.0" encoding="UTF-8"?>
<Bundle xmlns="http://schemas.microsoft.com/appx/2013/bundle" SchemaVersion="3.0">
  <Identity Name="Contoso.App" Publisher="CN=Contoso" Version="1.2.3.0"/>
  <Packages>
    <Package Type="resource" Version="1.2.3.0" ResourceId="split.scale-200" FileName="Contoso_scale-200.appx" Offset="61" Size="4096">
      <Resources><Resource Scale="200"/></Resources>
    </Package>
    <Package Type="application" Version="1.2.3.0" Architecture="x64" FileName="Contoso_x64.appx" Offset="4157" Size="123456"/>
    <Package Type="application" Version="1.2.3.0" Architecture="arm64" FileName="Contoso_arm64.appx"/>
  </Packages>
</Bundle>)";

    ASSERT_TRUE(parser_.parse(xml));
    const BundleManifest& manifest = parser_.getManifest();

    ASSERT_TRUE(manifest.identity.has_value());
    EXPECT_EQ(manifest.identity->name, "Contoso.App");
    EXPECT_EQ(manifest.identity->publisher, "CN=Contoso");
    EXPECT_EQ(manifest.identity->version, "1.2.3.0");

    ASSERT_EQ(manifest.packages.size(), 3u);

    const auto& resource = manifest.packages[0];
    EXPECT_EQ(resource.type, "resource");
    EXPECT_EQ(resource.resource_id, "split.scale-200");
    EXPECT_TRUE(resource.architecture.empty());
    EXPECT_FALSE(resource.isApplication());
    EXPECT_EQ(resource.offset, 61u);
    EXPECT_EQ(resource.size, 4096u);

    const auto& x64 = manifest.packages[1];
    EXPECT_EQ(x64.file_name, "Contoso_x64.appx");
    EXPECT_EQ(x64.partUri(), "/Contoso_x64.appx");
    EXPECT_EQ(x64.architecture, "x64");
    EXPECT_EQ(x64.version, "1.2.3.0");
    EXPECT_TRUE(x64.isApplication());
    EXPECT_EQ(x64.size, 123456u);

    EXPECT_FALSE(manifest.packages[2].offset.has_value());
    EXPECT_FALSE(manifest.packages[2].size.has_value());

    EXPECT_EQ(manifest.applicationPackageCount(), 2u);
}

// 测试2: 主程序包
TEST_F(BundleManifestParserTest, MainPackageIsFirstApplication) {
    std::string xml = test::bundleManifestXml({
        {"Contoso_en-us.appx", "resource", ""},
        {"Contoso_x86.appx", "Application", "x86"},
        {"Contoso_x64.appx", "APPLICATION", "x64"}
    });

    ASSERT_TRUE(parser_.parse(xml));
    const BundlePackageEntry* main_package = parser_.getManifest().mainPackage();
    ASSERT_NE(main_package, nullptr);
    EXPECT_EQ(main_package->file_name, "Contoso_x86.appx");
    EXPECT_EQ(parser_.getManifest().applicationPackageCount(), 2u);
}

TEST_F(BundleManifestParserTest, NoApplicationPackage) {
    std::string xml = test::bundleManifestXml({
        {"Contoso_en-us.appx", "resource", ""},
        {"Contoso_scale-200.appx", "resource", ""}
    });

    ASSERT_TRUE(parser_.parse(xml));
    EXPECT_EQ(parser_.getManifest().mainPackage(), nullptr);
    EXPECT_EQ(parser_.getManifest().packages.size(), 2u);
}

TEST_F(BundleManifestParserTest, EmptyPackagesList) {
    ASSERT_TRUE(parser_.parse("<Bundle><Packages/></Bundle>"));
    EXPECT_TRUE(parser_.getManifest().packages.empty());
    EXPECT_FALSE(parser_.getManifest().identity.has_value());
    EXPECT_EQ(parser_.getManifest().mainPackage(), nullptr);
}

// 测试3: 命名空间前缀不影响匹配
TEST_F(BundleManifestParserTest, PrefixedElementNames) {
    std::string xml = R"(<b:Bundle xmlns:b="http://schemas.microsoft.com/appx/2013/bundle">
  <b:Packages>
    <b:Package Type="application" FileName="Prefixed.appx"/>
  </b:Packages>
</b:Bundle>)";

    ASSERT_TRUE(parser_.parse(xml));
    ASSERT_EQ(parser_.getManifest().packages.size(), 1u);
    EXPECT_EQ(parser_.getManifest().packages[0].file_name, "Prefixed.appx");
}

// 只有Bundle/Packages/Package计为条目
TEST_F(BundleManifestParserTest, PackageOutsidePackagesIsIgnored) {
    std::string xml = R"(<Bundle>
  <Package Type="application" FileName="TopLevel.appx"/>
  <Other>
    <Package Type="application" FileName="Nested.appx"/>
  </Other>
  <Packages>
    <Package Type="application" FileName="Real.appx">
      <Package Type="application" FileName="TooDeep.appx"/>
    </Package>
  </Packages>
</Bundle>)";

    ASSERT_TRUE(parser_.parse(xml));
    ASSERT_EQ(parser_.getManifest().packages.size(), 1u);
    EXPECT_EQ(parser_.getManifest().packages[0].file_name, "Real.appx");
}

TEST_F(BundleManifestParserTest, NonNumericOffsetIsIgnored) {
    std::string xml = R"(<Bundle><Packages>
  <Package Type="application" FileName="a.appx" Offset="abc" Size="12x"/>
  <Package Type="application" FileName="b.appx" Offset="-5" Size="99999999999999999999999"/>
</Packages></Bundle>)";

    ASSERT_TRUE(parser_.parse(xml));
    const auto& packages = parser_.getManifest().packages;
    ASSERT_EQ(packages.size(), 2u);
    EXPECT_FALSE(packages[0].offset.has_value());
    EXPECT_FALSE(packages[0].size.has_value());
    EXPECT_FALSE(packages[1].offset.has_value());
    EXPECT_FALSE(packages[1].size.has_value());
}

// 测试4: 错误处理
TEST_F(BundleManifestParserTest, WrongRootElementFails) {
    EXPECT_FALSE(parser_.parse(test::sampleManifestXml()));
    EXPECT_TRUE(parser_.hasError());
    EXPECT_NE(parser_.getErrorMessage().find("Package"), std::string::npos);
}

TEST_F(BundleManifestParserTest, MalformedXmlFails) {
    EXPECT_FALSE(parser_.parse("<Bundle><Packages><Package FileName=\"a.appx\"></Packages></Bundle>"));
    EXPECT_TRUE(parser_.hasError());
}

TEST_F(BundleManifestParserTest, TakeManifestMovesResult) {
    ASSERT_TRUE(parser_.parse(test::bundleManifestXml({{"Contoso_x64.appx", "Application", "x64"}})));
    BundleManifest manifest = parser_.takeManifest();
    ASSERT_EQ(manifest.packages.size(), 1u);
    EXPECT_EQ(manifest.packages[0].offset, 100u);
    EXPECT_EQ(manifest.packages[0].size, 2048u);

    // 重新解析会重置结果
    ASSERT_TRUE(parser_.parse("<Bundle/>"));
    EXPECT_TRUE(parser_.getManifest().packages.empty());
}

}} // namespace appxmanifest::manifest
