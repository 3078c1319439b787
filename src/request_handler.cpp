#include "request_handler.hpp"
#include "directory_tree.hpp"
#include "exception.hpp"
#include "file_resolver.hpp"
#include "json_utils.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

namespace fs = std::filesystem;

namespace {
    const char* manifest_file = "package.json";

    bool is_existing_directory(const fs::path& path) {
        std::error_code ec;
        fs::file_status status = fs::status(path, ec);
        if (status.type() == fs::file_type::not_found) return false;
        if (ec) {
            throw FilesystemError(string_format("error.stat_failed", path.string(), ec.message()));
        }
        return fs::is_directory(status);
    }

    // The part of the original URL in front of the handler's own URL.
    std::string base_url_of(const Request& request) {
        const std::string& original = request.original_url;
        const std::string& url = request.url;
        if (original.size() >= url.size() && original.compare(original.size() - url.size(), url.size(), url) == 0) {
            return original.substr(0, original.size() - url.size());
        }
        return "";
    }

    std::string quoted(const std::string& s) {
        return "\"" + s + "\"";
    }
}

RequestHandler::RequestHandler(const CdnConfig& config, const Registry& registry, const PackageCache& cache)
    : config_(config), registry_(registry), cache_(cache) {}

void RequestHandler::handle(const Request& request, Responder& res) const {
    auto url = parse_package_url(request.url);
    if (!url) {
        res.send_invalid_url(request.url);
        return;
    }

    Context ctx{
        request,
        *url,
        base_url_of(request),
        url->package_name + "@" + url->version,
        cache_.directory_for(url->package_name, url->version),
    };

    try {
        if (cache_.is_cached(ctx.package_dir)) {
            // Best case: we already have this package on disk.
            log_debug(string_format("debug.cache_hit", ctx.display_name));
            serve_file(ctx, res);
        } else {
            resolve_package(ctx, res);
        }
    } catch (const std::exception& e) {
        res.send_server_error(string_format("error.request_failed", request.original_url, e.what()));
    }
}

void RequestHandler::resolve_package(const Context& ctx, Responder& res) const {
    const std::string& package_name = ctx.url.package_name;
    const std::string& version = ctx.url.version;

    auto info = registry_.get_package_info(package_name);
    if (!info) {
        res.send_not_found("package " + quoted(package_name));
        return;
    }

    if (info->has_version(version)) {
        // A valid request for a package we haven't downloaded yet.
        registry_.fetch_package(*info, version, cache_);
        serve_file(ctx, res);
        return;
    }

    auto tag = info->dist_tags.find(version);
    if (tag != info->dist_tags.end()) {
        redirect_to_version(ctx, tag->second, res);
        return;
    }

    auto max_version = max_satisfying(info->version_list(), version);
    if (max_version) {
        redirect_to_version(ctx, *max_version, res);
    } else {
        res.send_not_found("package " + ctx.display_name);
    }
}

void RequestHandler::redirect_to_version(const Context& ctx, const std::string& version, Responder& res) const {
    log_debug(string_format("debug.version_resolved", ctx.display_name, version));
    res.send_redirect(
        ctx.base_url + create_package_url(ctx.url.package_name, version, ctx.url.filename, ctx.url.search),
        config_.redirect_ttl);
}

void RequestHandler::serve_file(const Context& ctx, Responder& res) const {
    if (ctx.url.filename == config_.bundle_path) {
        serve_bundle(ctx, res);
    } else if (!ctx.url.filename.empty()) {
        serve_path(ctx, res);
    } else {
        serve_main(ctx, res);
    }
}

void RequestHandler::serve_bundle(const Context& ctx, Responder& res) const {
    const std::string subject = config_.bundle_path.substr(1) + " in package " + ctx.display_name;
    if (!bundle_provider_) {
        res.send_not_found(subject);
        return;
    }

    auto file = bundle_provider_(ctx.package_dir);
    if (!file) {
        res.send_not_found(subject);
    } else {
        res.send_file(*file, ONE_YEAR);
    }
}

void RequestHandler::serve_path(const Context& ctx, Responder& res) const {
    const std::string& filename = ctx.url.filename;
    const std::string not_found = "file " + quoted(filename) + " in package " + ctx.display_name;

    auto filepath = join_package_path(ctx.package_dir, filename);
    if (!filepath) {
        res.send_not_found(not_found);
        return;
    }

    // Try to serve the file in the URL, or at least a directory index.
    auto file = resolve_file(*filepath, false);
    if (file) {
        if (!is_within_package(*file, ctx.package_dir)) {
            res.send_not_found(not_found);
        } else {
            res.send_file(*file, ONE_YEAR);
        }
        return;
    }

    if (!config_.auto_index || !is_existing_directory(*filepath) || !is_within_package(*filepath, ctx.package_dir)) {
        res.send_not_found(not_found);
        return;
    }

    // Directory URLs always end with a literal "/"; an encoded "%2F" does not count.
    const std::string& raw_url = ctx.request.url;
    const std::string raw_path = raw_url.substr(0, raw_url.find('?'));
    if (raw_path.back() != '/') {
        const std::string& original = ctx.request.original_url;
        size_t query_pos = original.find('?');
        std::string location = original.substr(0, query_pos) + "/";
        if (query_pos != std::string::npos) location += original.substr(query_pos);
        res.send_redirect(location, config_.redirect_ttl);
        return;
    }

    FileSystemEntry tree = build_directory_tree(ctx.package_dir, filename, effective_maximum_depth(config_));
    res.send_json(directory_tree_to_json(tree), ONE_YEAR);
}

void RequestHandler::serve_main(const Context& ctx, Responder& res) const {
    // No filename in the URL. Try to serve the package's "main" file.
    const fs::path manifest_path = ctx.package_dir / manifest_file;
    if (!is_within_package(manifest_path, ctx.package_dir)) {
        throw FilesystemError(string_format("error.path_traversal", manifest_path.string()));
    }
    const std::string data = read_file_to_string(manifest_path);

    Json::Value package_config;
    try {
        package_config = parse_json(data, manifest_file);
    } catch (const PkgcdnException& e) {
        log_error(string_format("error.request_failed", ctx.request.original_url, e.what()));
        res.send_text(500, "Error parsing package.json: " + std::string(e.what()));
        return;
    }
    if (!package_config.isObject()) {
        res.send_text(500, "Error parsing package.json: " + get_string("error.manifest_not_object"));
        return;
    }

    auto query_main = ctx.url.query.find("main");
    const bool has_query_main = query_main != ctx.url.query.end() && !query_main->second.empty();

    if (has_query_main && !package_config.isMember(query_main->second)) {
        res.send_not_found("field " + quoted(query_main->second) + " in package.json of " + ctx.display_name);
        return;
    }

    // Default main is index, same as npm.
    const std::string main_property = has_query_main ? query_main->second : "main";
    const Json::Value& main_value = package_config[main_property];
    const std::string main_filename =
        main_value.isString() && !main_value.asString().empty() ? main_value.asString() : "index";

    const std::string not_found = "main file " + quoted(main_filename) + " in package " + ctx.display_name;
    auto main_path = join_package_path(ctx.package_dir, main_filename);
    if (!main_path) {
        res.send_not_found(not_found);
        return;
    }

    auto file = resolve_file(*main_path, true);
    if (!file || !is_within_package(*file, ctx.package_dir)) {
        res.send_not_found(not_found);
    } else {
        res.send_file(*file, ONE_YEAR);
    }
}
