#include "registry_fixture.hpp"
#include "../src/cache.hpp"
#include "../src/config.hpp"
#include "../src/registry.hpp"
#include "../src/request_handler.hpp"
#include "../src/response.hpp"

#include <memory>

class RequestHandlerTest : public RegistryFixture {
protected:
    CdnConfig config;
    std::unique_ptr<Registry> registry;
    std::unique_ptr<PackageCache> cache;
    std::unique_ptr<RequestHandler> handler;

    void SetUp() override {
        RegistryFixture::SetUp();
        publish("tiny",
            {
                {"1.0.0", {}},
                {"1.2.0", {}},
                {"2.0.0", {
                    {"package.json", "{\"name\":\"tiny\",\"version\":\"2.0.0\",\"main\":\"lib/foo\",\"browser\":\"browser.js\"}"},
                    {"lib/foo.js", "module.exports = 'foo';\n"},
                    {"lib/index.js", "module.exports = 'index';\n"},
                    {"lib/data/table.json", "[]"},
                    {"browser.js", "window.tiny = 1;\n"},
                    {"what?.js", "1"},
                    {"my file.js", "2"},
                }},
            },
            {{"latest", "2.0.0"}, {"legacy", "1.0.0"}});

        config.registry_url = registry_url();
        config.cache_dir = cache_dir;
        make_handler();
    }

    void make_handler() {
        handler.reset();
        registry = std::make_unique<Registry>(config.registry_url, TransferOptions{2, 10});
        cache = std::make_unique<PackageCache>(config.cache_dir);
        handler = std::make_unique<RequestHandler>(config, *registry, *cache);
    }

    Response get(const std::string& url, const std::string& original_url = "") {
        BufferedResponder res;
        handler->handle(Request{url, original_url.empty() ? url : original_url}, res);
        EXPECT_TRUE(res.sent());
        return res.take();
    }

    static std::string location(const Response& response) {
        const std::string* value = response.header("Location");
        return value ? *value : "";
    }
};

TEST_F(RequestHandlerTest, LatestIsImplied) {
    Response r = get("/tiny");
    EXPECT_EQ(r.status, 302);
    EXPECT_EQ(location(r), "/tiny@2.0.0");
    EXPECT_EQ(r.header("Cache-Control"), nullptr);
}

TEST_F(RequestHandlerTest, RedirectKeepsFilenameAndQuery) {
    Response r = get("/tiny/lib/foo.js?main=browser");
    EXPECT_EQ(r.status, 302);
    EXPECT_EQ(location(r), "/tiny@2.0.0/lib/foo.js?main=browser");
}

TEST_F(RequestHandlerTest, RedirectKeepsMountPrefix) {
    Response r = get("/tiny@legacy", "/cdn/tiny@legacy");
    EXPECT_EQ(r.status, 302);
    EXPECT_EQ(location(r), "/cdn/tiny@1.0.0");
}

TEST_F(RequestHandlerTest, RangeResolvesToMaxSatisfying) {
    Response r = get("/tiny@^1/index.js");
    EXPECT_EQ(r.status, 302);
    EXPECT_EQ(location(r), "/tiny@1.2.0/index.js");
}

TEST_F(RequestHandlerTest, RedirectTtl) {
    config.redirect_ttl = 600;
    make_handler();
    Response r = get("/tiny@~1.0");
    EXPECT_EQ(location(r), "/tiny@1.0.0");
    ASSERT_NE(r.header("Cache-Control"), nullptr);
    EXPECT_EQ(*r.header("Cache-Control"), "public, max-age=600");
}

TEST_F(RequestHandlerTest, MainFileWithExtensionResolution) {
    Response r = get("/tiny@2.0.0");
    EXPECT_EQ(r.status, 200);
    ASSERT_TRUE(r.file.has_value());
    EXPECT_EQ(*r.file, cache->directory_for("tiny", "2.0.0") / "lib" / "foo.js");
    EXPECT_EQ(*r.header("Content-Type"), "application/javascript");
    EXPECT_EQ(*r.header("Cache-Control"), "public, max-age=31536000");
    EXPECT_NE(r.header("ETag"), nullptr);
    EXPECT_NE(r.header("Last-Modified"), nullptr);
}

TEST_F(RequestHandlerTest, MainFieldFromQuery) {
    Response r = get("/tiny@2.0.0?main=browser");
    EXPECT_EQ(r.status, 200);
    ASSERT_TRUE(r.file.has_value());
    EXPECT_EQ(r.file->filename(), "browser.js");

    Response missing = get("/tiny@2.0.0?main=unpkg");
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(missing.body, "Not found: field \"unpkg\" in package.json of tiny@2.0.0");
}

TEST_F(RequestHandlerTest, DefaultMainIsIndex) {
    Response r = get("/tiny@1.0.0");
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(r.body, "Not found: main file \"index\" in package tiny@1.0.0");
}

TEST_F(RequestHandlerTest, ExactFiles) {
    Response r = get("/tiny@2.0.0/lib/data/table.json");
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(*r.header("Content-Type"), "application/json");
    EXPECT_EQ(*r.header("Content-Length"), "2");

    Response extensionless = get("/tiny@2.0.0/lib/foo");
    EXPECT_EQ(extensionless.status, 200);
    EXPECT_EQ(extensionless.file->filename(), "foo.js");

    Response missing = get("/tiny@2.0.0/nope.js");
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(missing.body, "Not found: file \"/nope.js\" in package tiny@2.0.0");

    Response escape = get("/tiny@2.0.0/../../../etc/passwd");
    EXPECT_EQ(escape.status, 404);
}

TEST_F(RequestHandlerTest, DirectoryRedirectsToTrailingSlash) {
    Response r = get("/tiny@2.0.0/lib?x=1", "/cdn/tiny@2.0.0/lib?x=1");
    EXPECT_EQ(r.status, 302);
    EXPECT_EQ(location(r), "/cdn/tiny@2.0.0/lib/?x=1");
}

TEST_F(RequestHandlerTest, DirectoryListing) {
    Response r = get("/tiny@2.0.0/lib/");
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(*r.header("Content-Type"), "application/json");

    Json::Value json = parse_json(r.body, "listing");
    EXPECT_EQ(json["path"].asString(), "/lib");
    EXPECT_EQ(json["type"].asString(), "directory");
    ASSERT_TRUE(json["children"].isArray());
    EXPECT_EQ(json["children"].size(), 3u);
}

TEST_F(RequestHandlerTest, ListingDepthAndAutoIndex) {
    config.maximum_depth = 0;
    make_handler();
    Response shallow = get("/tiny@2.0.0/lib/");
    EXPECT_EQ(shallow.status, 200);
    EXPECT_TRUE(parse_json(shallow.body, "listing")["children"].isNull());

    config.auto_index = false;
    make_handler();
    Response off = get("/tiny@2.0.0/lib/");
    EXPECT_EQ(off.status, 404);
    EXPECT_EQ(off.body, "Not found: file \"/lib/\" in package tiny@2.0.0");
}

TEST_F(RequestHandlerTest, UnknownPackageAndVersion) {
    Response unknown = get("/nope");
    EXPECT_EQ(unknown.status, 404);
    EXPECT_EQ(unknown.body, "Not found: package \"nope\"");

    Response range = get("/tiny@^9");
    EXPECT_EQ(range.status, 404);
    EXPECT_EQ(range.body, "Not found: package tiny@^9");
}

TEST_F(RequestHandlerTest, InvalidUrl) {
    Response r = get("/");
    EXPECT_EQ(r.status, 403);
    EXPECT_EQ(r.body, "Invalid URL: /");
}

TEST_F(RequestHandlerTest, CacheHitNeedsNoRegistry) {
    EXPECT_EQ(get("/tiny@2.0.0/browser.js").status, 200);
    fs::remove(registry_dir / "tiny");
    EXPECT_EQ(get("/tiny@2.0.0/browser.js").status, 200);
    EXPECT_EQ(get("/tiny@2.0.0").status, 200);
}

TEST_F(RequestHandlerTest, BrokenManifest) {
    fs::path dir = cache->directory_for("broken", "1.0.0");
    fs::create_directories(dir);
    std::ofstream(dir / "package.json") << "{\"main\":";

    Response r = get("/broken@1.0.0");
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(r.body.rfind("Error parsing package.json: ", 0), 0u);
}

TEST_F(RequestHandlerTest, BundlePath) {
    Response none = get("/tiny@2.0.0/bower.zip");
    EXPECT_EQ(none.status, 404);
    EXPECT_EQ(none.body, "Not found: bower.zip in package tiny@2.0.0");

    fs::path bundle = suite_work_dir / "tiny.zip";
    std::ofstream(bundle) << "PK";
    handler->set_bundle_provider([&](const fs::path& package_dir) -> std::optional<fs::path> {
        if (package_dir.filename() != "tiny-2.0.0") return std::nullopt;
        return bundle;
    });
    Response r = get("/tiny@2.0.0/bower.zip");
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(*r.header("Content-Type"), "application/zip");
}

TEST_F(RequestHandlerTest, RegistryFailureIsServerError) {
    config.registry_url = "http://127.0.0.1:9";
    make_handler();
    Response r = get("/tiny");
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(r.body, "Server error");
}

TEST_F(RequestHandlerTest, RedirectReencodesFilename) {
    Response r = get("/tiny@latest/what%3F.js");
    EXPECT_EQ(r.status, 302);
    EXPECT_EQ(location(r), "/tiny@2.0.0/what%3F.js");

    Response followed = get(location(r));
    EXPECT_EQ(followed.status, 200);
    ASSERT_TRUE(followed.file.has_value());
    EXPECT_EQ(followed.file->filename(), "what?.js");

    Response spaced = get("/tiny/my%20file.js?x=1");
    EXPECT_EQ(location(spaced), "/tiny@2.0.0/my%20file.js?x=1");
}

TEST_F(RequestHandlerTest, EncodedSlashIsNotADirectoryUrl) {
    Response r = get("/tiny@2.0.0/lib%2F");
    EXPECT_EQ(r.status, 302);
    EXPECT_EQ(location(r), "/tiny@2.0.0/lib%2F/");

    Response listing = get(location(r));
    EXPECT_EQ(listing.status, 200);
    EXPECT_EQ(parse_json(listing.body, "listing")["path"].asString(), "/lib");
}

TEST_F(RequestHandlerTest, StatFailureIsServerError) {
    fs::path dir = cache->directory_for("loopy", "1.0.0");
    fs::create_directories(dir);
    std::ofstream(dir / "package.json") << "{}";
    std::ofstream(dir / "loop.js") << "1";
    fs::create_symlink("loop", dir / "loop");

    Response r = get("/loopy@1.0.0/loop");
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(r.body, "Server error");
}

TEST_F(RequestHandlerTest, ChainedSymlinksStayInsidePackage) {
    Links links;
    links.symlinks = {
        {"a/b/s", "../.."},
        {"t", "a/b/s/.."},
        {"u1", "t/.."},
        {"u2", "u1/.."},
        {"alias.js", "index.js"},
    };
    publish("evil",
        {{"1.0.0", {
            {"package.json", "{\"name\":\"evil\",\"main\":\"u1/secret.txt\"}"},
            {"index.js", "module.exports = 1;\n"},
        }}},
        {{"latest", "1.0.0"}}, links);
    std::ofstream(suite_work_dir / "secret.txt") << "top secret";

    // Every link passes a lexical check, so all of them are extracted.
    Response alias = get("/evil@1.0.0/alias.js");
    EXPECT_EQ(alias.status, 200);
    fs::path dir = cache->directory_for("evil", "1.0.0");
    ASSERT_TRUE(fs::is_symlink(dir / "u1"));
    ASSERT_TRUE(fs::exists(dir / "u1" / "secret.txt"));

    Response file = get("/evil@1.0.0/u1/secret.txt");
    EXPECT_EQ(file.status, 404);
    EXPECT_EQ(file.body, "Not found: file \"/u1/secret.txt\" in package evil@1.0.0");
    EXPECT_FALSE(file.file.has_value());

    EXPECT_EQ(get("/evil@1.0.0/t/").status, 404);
    EXPECT_EQ(get("/evil@1.0.0/t").status, 404);
    EXPECT_EQ(get("/evil@1.0.0/u2/").status, 404);

    Response entry = get("/evil@1.0.0");
    EXPECT_EQ(entry.status, 404);
    EXPECT_EQ(entry.body, "Not found: main file \"u1/secret.txt\" in package evil@1.0.0");

    // Links are listed, not followed.
    Response listing = get("/evil@1.0.0/");
    EXPECT_EQ(listing.status, 200);
    Json::Value tree = parse_json(listing.body, "listing");
    ASSERT_TRUE(tree["children"].isArray());
    for (const auto& child : tree["children"]) {
        if (child["path"].asString() == "/u1") EXPECT_EQ(child["type"].asString(), "symlink");
    }
}
