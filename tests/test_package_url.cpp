#include <gtest/gtest.h>
#include "../src/package_url.hpp"

TEST(PackageUrlTest, BareName) {
    auto url = parse_package_url("/react");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->package_name, "react");
    EXPECT_EQ(url->version, "latest");
    EXPECT_EQ(url->filename, "");
    EXPECT_EQ(url->search, "");
    EXPECT_TRUE(url->query.empty());
}

TEST(PackageUrlTest, VersionAndFile) {
    auto url = parse_package_url("/history@1.12.5/umd/History.min.js");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->package_name, "history");
    EXPECT_EQ(url->version, "1.12.5");
    EXPECT_EQ(url->filename, "/umd/History.min.js");
}

TEST(PackageUrlTest, ScopedPackages) {
    auto url = parse_package_url("/@babel/core@^7.0.0/lib/index.js?meta");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->package_name, "@babel/core");
    EXPECT_EQ(url->version, "^7.0.0");
    EXPECT_EQ(url->filename, "/lib/index.js");
    EXPECT_EQ(url->search, "?meta");

    auto bare = parse_package_url("/@babel/core");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->package_name, "@babel/core");
    EXPECT_EQ(bare->version, "latest");

    EXPECT_FALSE(parse_package_url("/@babel").has_value());
    EXPECT_FALSE(parse_package_url("/@/core").has_value());
}

TEST(PackageUrlTest, EncodedVersionAndQuery) {
    auto url = parse_package_url("/react@%3E%3D15%20%3C16/index.js?main=browser&x=1");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->version, ">=15 <16");
    EXPECT_EQ(url->search, "?main=browser&x=1");
    EXPECT_EQ(url->query.at("main"), "browser");
    EXPECT_EQ(url->query.at("x"), "1");
}

TEST(PackageUrlTest, TrailingSlashIsKept) {
    auto url = parse_package_url("/react@16.0.0/lib/");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->filename, "/lib/");
}

TEST(PackageUrlTest, InvalidUrls) {
    EXPECT_FALSE(parse_package_url("").has_value());
    EXPECT_FALSE(parse_package_url("/").has_value());
    EXPECT_FALSE(parse_package_url("react").has_value());
    EXPECT_FALSE(parse_package_url("/react@").has_value());
    EXPECT_FALSE(parse_package_url("/react@1.0.0%2Fevil").has_value());
    EXPECT_FALSE(parse_package_url("/react@1.0.0/a%00b").has_value());
}

TEST(PackageUrlTest, CreatePackageUrl) {
    EXPECT_EQ(create_package_url("react", "16.0.0", "/index.js", "?main=x"), "/react@16.0.0/index.js?main=x");
    EXPECT_EQ(create_package_url("@scope/pkg", "1.0.0", "", ""), "/@scope/pkg@1.0.0");
}

TEST(PackageUrlTest, ReconstructionIsLossless) {
    for (const std::string path : {"/react@16.0.0/index.js", "/@babel/core@7.1.0/lib/", "/left-pad@latest/a/b.json?main=x"}) {
        auto url = parse_package_url(path);
        ASSERT_TRUE(url.has_value()) << path;
        EXPECT_EQ(create_package_url(url->package_name, url->version, url->filename, url->search), path);
    }
}

TEST(PackageUrlTest, CreateEncodesFilenameSegments) {
    EXPECT_EQ(create_package_url("tiny", "2.0.0", "/what?.js", ""), "/tiny@2.0.0/what%3F.js");
    EXPECT_EQ(create_package_url("tiny", "2.0.0", "/dir #1/a%b.js", "?q"), "/tiny@2.0.0/dir%20%231/a%25b.js?q");
    EXPECT_EQ(create_package_url("tiny", "2.0.0", "/bad\r\nname/", ""), "/tiny@2.0.0/bad%0D%0Aname/");

    auto url = parse_package_url(create_package_url("tiny", "2.0.0", "/a b/c?d.js", ""));
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->filename, "/a b/c?d.js");
    EXPECT_EQ(url->search, "");
}
