#pragma once

#include "cache.hpp"
#include "config.hpp"
#include "package_url.hpp"
#include "registry.hpp"
#include "response.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

struct Request {
    std::string url;          // path below the mount point, with query string
    std::string original_url; // full request URI as received
};

// Builds the bundle served at the configured bundle path. Returns the bundle
// file, or std::nullopt if the package has none.
using BundleProvider = std::function<std::optional<std::filesystem::path>(const std::filesystem::path& package_dir)>;

// Supported URL schemes are:
//
// /history@1.12.5/umd/History.min.js (recommended)
// /history@1.12.5 (package.json's main is implied)
//
// Additionally, the following URLs are supported but will return a
// temporary (302) redirect:
//
// /history (redirects to version, latest is implied)
// /history/umd/History.min.js (redirects to version, latest is implied)
// /history@latest/umd/History.min.js (redirects to version)
// /history@^1/umd/History.min.js (redirects to max satisfying version)
class RequestHandler {
public:
    RequestHandler(const CdnConfig& config, const Registry& registry, const PackageCache& cache);

    void set_bundle_provider(BundleProvider provider) { bundle_provider_ = std::move(provider); }

    // Sends exactly one response for the request.
    void handle(const Request& request, Responder& res) const;

private:
    struct Context {
        const Request& request;
        const PackageUrl& url;
        std::string base_url;
        std::string display_name;
        std::filesystem::path package_dir;
    };

    void resolve_package(const Context& ctx, Responder& res) const;
    void serve_file(const Context& ctx, Responder& res) const;
    void serve_bundle(const Context& ctx, Responder& res) const;
    void serve_path(const Context& ctx, Responder& res) const;
    void serve_main(const Context& ctx, Responder& res) const;
    void redirect_to_version(const Context& ctx, const std::string& version, Responder& res) const;

    const CdnConfig& config_;
    const Registry& registry_;
    const PackageCache& cache_;
    BundleProvider bundle_provider_;
};
