#include <gtest/gtest.h>
#include "../src/directory_tree.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include <filesystem>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

class DirectoryTreeTest : public ::testing::Test {
protected:
    fs::path pkg_dir;

    void SetUp() override {
        init_localization();
        pkg_dir = fs::absolute("tmp_directory_tree_test");
        if (fs::exists(pkg_dir)) fs::remove_all(pkg_dir);
        fs::create_directories(pkg_dir / "lib" / "nested");
        write("package.json", "{}");
        write("lib/index.js", "module.exports = 1;\n");
        write("lib/nested/deep.css", "a{}");
        fs::create_symlink("index.js", pkg_dir / "lib" / "alias.js");
    }

    void TearDown() override {
        if (fs::exists(pkg_dir)) fs::remove_all(pkg_dir);
    }

    void write(const std::string& rel, const std::string& content) {
        std::ofstream f(pkg_dir / rel);
        f << content;
    }

    static const FileSystemEntry* find_child(const FileSystemEntry& entry, const std::string& path) {
        if (!entry.children) return nullptr;
        for (const auto& child : *entry.children) {
            if (child.path == path) return &child;
        }
        return nullptr;
    }
};

TEST_F(DirectoryTreeTest, RootListing) {
    FileSystemEntry root = build_directory_tree(pkg_dir, "/", 1);
    EXPECT_EQ(root.path, "/");
    EXPECT_EQ(root.type, EntryType::DIRECTORY);
    ASSERT_TRUE(root.children.has_value());
    EXPECT_EQ(root.children->size(), 2u);

    const FileSystemEntry* manifest = find_child(root, "/package.json");
    ASSERT_NE(manifest, nullptr);
    EXPECT_EQ(manifest->type, EntryType::FILE);
    EXPECT_EQ(manifest->size, 2);
    EXPECT_EQ(manifest->content_type, "application/json");
    EXPECT_FALSE(manifest->children.has_value());

    // Depth is exhausted one level down.
    const FileSystemEntry* lib = find_child(root, "/lib");
    ASSERT_NE(lib, nullptr);
    EXPECT_EQ(lib->type, EntryType::DIRECTORY);
    EXPECT_FALSE(lib->children.has_value());
}

TEST_F(DirectoryTreeTest, SubdirectoryWithTrailingSlash) {
    FileSystemEntry lib = build_directory_tree(pkg_dir, "/lib/", 8);
    EXPECT_EQ(lib.path, "/lib");
    ASSERT_TRUE(lib.children.has_value());

    std::set<std::string> paths;
    for (const auto& child : *lib.children) paths.insert(child.path);
    EXPECT_EQ(paths, (std::set<std::string>{"/lib/index.js", "/lib/nested", "/lib/alias.js"}));

    const FileSystemEntry* alias = find_child(lib, "/lib/alias.js");
    ASSERT_NE(alias, nullptr);
    EXPECT_EQ(alias->type, EntryType::SYMLINK);

    const FileSystemEntry* nested = find_child(lib, "/lib/nested");
    ASSERT_NE(nested, nullptr);
    ASSERT_TRUE(nested->children.has_value());
    ASSERT_EQ(nested->children->size(), 1u);
    EXPECT_EQ(nested->children->front().path, "/lib/nested/deep.css");
    EXPECT_EQ(nested->children->front().content_type, "text/css");
}

TEST_F(DirectoryTreeTest, ZeroDepthHasNoChildren) {
    FileSystemEntry root = build_directory_tree(pkg_dir, "/", 0);
    EXPECT_FALSE(root.children.has_value());

    Json::Value json = directory_tree_to_json(root);
    EXPECT_TRUE(json.isMember("children"));
    EXPECT_TRUE(json["children"].isNull());
}

TEST_F(DirectoryTreeTest, JsonShape) {
    Json::Value json = directory_tree_to_json(build_directory_tree(pkg_dir, "/lib/nested/", 1));
    EXPECT_EQ(json["path"].asString(), "/lib/nested");
    EXPECT_EQ(json["type"].asString(), "directory");
    ASSERT_TRUE(json["children"].isArray());
    ASSERT_EQ(json["children"].size(), 1u);

    const Json::Value& file = json["children"][0];
    EXPECT_EQ(file["type"].asString(), "file");
    EXPECT_EQ(file["size"].asInt64(), 3);
    EXPECT_FALSE(file.isMember("children"));

    const std::string modified = file["lastModified"].asString();
    ASSERT_EQ(modified.size(), 24u);
    EXPECT_EQ(modified[10], 'T');
    EXPECT_EQ(modified.back(), 'Z');
}

TEST_F(DirectoryTreeTest, MissingDirectoryThrows) {
    EXPECT_THROW(build_directory_tree(pkg_dir, "/missing/", 1), FilesystemError);
}
