#include <gtest/gtest.h>
#include "../src/cache.hpp"
#include "../src/localization.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class CacheTest : public ::testing::Test {
protected:
    fs::path cache_root;

    void SetUp() override {
        init_localization();
        cache_root = fs::absolute("tmp_cache_test");
        if (fs::exists(cache_root)) fs::remove_all(cache_root);
    }

    void TearDown() override {
        if (fs::exists(cache_root)) fs::remove_all(cache_root);
    }

    static void write_manifest(const fs::path& dir) {
        fs::create_directories(dir);
        std::ofstream f(dir / "package.json");
        f << "{\"name\":\"x\"}";
    }
};

TEST_F(CacheTest, DirectoryLayout) {
    PackageCache cache(cache_root);
    EXPECT_EQ(cache.directory_for("react", "16.0.0"), cache_root / "react-16.0.0");
    EXPECT_EQ(cache.directory_for("@scope/pkg", "1.0.0"), cache_root / "@scope" / "pkg-1.0.0");
}

TEST_F(CacheTest, OnlyManifestCountsAsCached) {
    PackageCache cache(cache_root);
    fs::path dir = cache.directory_for("react", "16.0.0");
    EXPECT_FALSE(cache.is_cached(dir));

    fs::create_directories(dir);
    EXPECT_FALSE(cache.is_cached(dir));

    write_manifest(dir);
    EXPECT_TRUE(cache.is_cached(dir));
}

TEST_F(CacheTest, PublishMovesStagingIntoPlace) {
    PackageCache cache(cache_root);
    fs::path staging = cache.create_staging_dir("@scope/pkg", "1.0.0");
    EXPECT_TRUE(fs::is_directory(staging));
    EXPECT_EQ(staging.parent_path(), cache_root / ".staging");

    write_manifest(staging / "package");
    fs::path dest = cache.directory_for("@scope/pkg", "1.0.0");
    EXPECT_TRUE(cache.publish(staging / "package", dest));
    EXPECT_TRUE(cache.is_cached(dest));
    EXPECT_FALSE(fs::exists(staging / "package"));
}

TEST_F(CacheTest, LosingPublishIsDiscarded) {
    PackageCache cache(cache_root);
    fs::path dest = cache.directory_for("react", "16.0.0");
    write_manifest(dest);

    fs::path staging = cache.create_staging_dir("react", "16.0.0");
    write_manifest(staging / "package");
    std::ofstream(staging / "package" / "extra.js") << "1";

    EXPECT_FALSE(cache.publish(staging / "package", dest));
    EXPECT_FALSE(fs::exists(staging / "package"));
    EXPECT_TRUE(cache.is_cached(dest));
    EXPECT_FALSE(fs::exists(dest / "extra.js"));
}

TEST_F(CacheTest, StagingDirCleansUp) {
    PackageCache cache(cache_root);
    fs::path kept;
    fs::path dropped;
    {
        StagingDir a(cache.create_staging_dir("a", "1.0.0"));
        StagingDir b(cache.create_staging_dir("b", "1.0.0"));
        kept = a.path();
        dropped = b.path();
        a.release();
    }
    EXPECT_TRUE(fs::exists(kept));
    EXPECT_FALSE(fs::exists(dropped));
}
