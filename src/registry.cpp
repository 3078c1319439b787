#include "registry.hpp"
#include "archive.hpp"
#include "cache.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "json_utils.hpp"
#include "localization.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

bool PackageInfo::has_version(const std::string& version) const {
    return versions.isObject() && versions.isMember(version);
}

std::vector<std::string> PackageInfo::version_list() const {
    if (!versions.isObject()) return {};
    return versions.getMemberNames();
}

Registry::Registry(std::string registry_url, TransferOptions options)
    : registry_url_(std::move(registry_url)), options_(options) {
    while (!registry_url_.empty() && registry_url_.back() == '/') {
        registry_url_.pop_back();
    }
}

std::string Registry::package_info_url(const std::string& package_name) const {
    // Scoped packages are addressed as "@scope%2Fname".
    std::string encoded = package_name;
    size_t slash = encoded.find('/');
    if (!encoded.empty() && encoded[0] == '@' && slash != std::string::npos) {
        encoded.replace(slash, 1, "%2F");
    }
    return registry_url_ + "/" + encoded;
}

std::optional<PackageInfo> Registry::get_package_info(const std::string& package_name) const {
    const std::string url = package_info_url(package_name);
    HttpResponse response = http_get(url, options_);

    if (response.status == 404) {
        return std::nullopt;
    }
    if (response.status < 200 || response.status >= 300) {
        throw UpstreamError(string_format("error.registry_status", package_name, response.status));
    }

    Json::Value root;
    try {
        root = parse_json(response.body, url);
    } catch (const PkgcdnException& e) {
        throw UpstreamError(e.what());
    }

    if (!root.isObject() || !root["versions"].isObject()) {
        throw UpstreamError(string_format("error.registry_bad_info", package_name));
    }

    PackageInfo info;
    info.name = package_name;
    info.versions = root["versions"];

    const Json::Value& tags = root["dist-tags"];
    if (tags.isObject()) {
        for (const auto& tag : tags.getMemberNames()) {
            if (tags[tag].isString()) {
                info.dist_tags[tag] = tags[tag].asString();
            }
        }
    }
    return info;
}

void Registry::fetch_package(const PackageInfo& info, const std::string& version, const PackageCache& cache) const {
    const Json::Value& manifest = info.versions[version];
    const Json::Value& dist = manifest["dist"];
    if (!dist.isObject() || !dist["tarball"].isString()) {
        throw UpstreamError(string_format("error.registry_no_tarball", info.name, version));
    }

    const std::string tarball_url = dist["tarball"].asString();
    const std::string integrity = dist["integrity"].isString() ? dist["integrity"].asString() : "";
    const std::string shasum = dist["shasum"].isString() ? dist["shasum"].asString() : "";

    StagingDir staging(cache.create_staging_dir(info.name, version));
    const fs::path archive_path = staging.path() / "package.tgz";
    const fs::path extract_dir = staging.path() / "package";

    log_info(string_format("info.fetching_tarball", info.name, version, tarball_url));
    download_file(tarball_url, archive_path, options_);
    verify_tarball(archive_path, integrity, shasum);

    try {
        ensure_dir_exists(extract_dir);
    } catch (const PkgcdnException& e) {
        throw UpstreamError(e.what());
    }
    extract_tarball(archive_path, extract_dir);

    const fs::path package_dir = cache.directory_for(info.name, version);
    if (cache.publish(extract_dir, package_dir)) {
        log_info(string_format("info.package_cached", info.name, version));
    }
}
