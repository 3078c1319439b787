#include "cache.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace fs = std::filesystem;

namespace {
    const char* manifest_file = "package.json";
    const char* staging_subdir = ".staging";

    std::string flatten_name(const std::string& package_name) {
        std::string flat = package_name;
        for (auto& c : flat) {
            if (c == '/') c = '+';
        }
        return flat;
    }
}

PackageCache::PackageCache(fs::path root) : root_(std::move(root)) {}

fs::path PackageCache::directory_for(const std::string& package_name, const std::string& version) const {
    return root_ / (package_name + "-" + version);
}

bool PackageCache::is_cached(const fs::path& package_dir) const {
    std::error_code ec;
    return fs::is_regular_file(package_dir / manifest_file, ec);
}

fs::path PackageCache::create_staging_dir(const std::string& package_name, const std::string& version) const {
    fs::path staging_root = root_ / staging_subdir;
    ensure_dir_exists(staging_root);

    std::string tmpl = (staging_root / (flatten_name(package_name) + "-" + version + "-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        throw FilesystemError(string_format("error.create_dir_failed", tmpl) + ": " + std::strerror(errno));
    }
    return fs::path(buf.data());
}

bool PackageCache::publish(const fs::path& staging_dir, const fs::path& package_dir) const {
    ensure_dir_exists(package_dir.parent_path());

    std::error_code ec;
    fs::rename(staging_dir, package_dir, ec);
    if (!ec) {
        log_debug(string_format("debug.cache_published", package_dir.string()));
        return true;
    }

    if (ec == std::errc::directory_not_empty || ec == std::errc::file_exists) {
        log_warning(string_format("warning.publish_race", package_dir.string()));
        std::error_code remove_ec;
        fs::remove_all(staging_dir, remove_ec);
        return false;
    }

    throw FilesystemError(string_format("error.publish_failed", package_dir.string(), ec.message()));
}

StagingDir::~StagingDir() {
    if (released_ || path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        log_warning(string_format("warning.staging_cleanup_failed", path_.string(), ec.message()));
    }
}
