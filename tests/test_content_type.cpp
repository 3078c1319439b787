#include <gtest/gtest.h>
#include "../src/content_type.hpp"

TEST(ContentTypeTest, KnownExtensions) {
    EXPECT_EQ(get_content_type("/index.js"), "application/javascript");
    EXPECT_EQ(get_content_type("/package.json"), "application/json");
    EXPECT_EQ(get_content_type("/dist/app.min.css"), "text/css");
    EXPECT_EQ(get_content_type("/README.md"), "text/markdown");
    EXPECT_EQ(get_content_type("/logo.SVG"), "image/svg+xml");
}

TEST(ContentTypeTest, ExtensionlessTextFiles) {
    EXPECT_EQ(get_content_type("/LICENSE"), "text/plain");
    EXPECT_EQ(get_content_type("/docs/README"), "text/plain");
}

TEST(ContentTypeTest, Fallback) {
    EXPECT_EQ(get_content_type("/bin/tool"), "application/octet-stream");
    EXPECT_EQ(get_content_type("/data.unknownext"), "application/octet-stream");
    EXPECT_EQ(get_content_type("/lib"), "application/octet-stream");
}
