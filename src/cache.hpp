#pragma once

#include <filesystem>
#include <string>

// On-disk package cache. Each exact package version is extracted once into
// <root>/<name>-<version>; a directory holding a package.json is a cache hit.
class PackageCache {
public:
    explicit PackageCache(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path directory_for(const std::string& package_name, const std::string& version) const;
    bool is_cached(const std::filesystem::path& package_dir) const;

    // Creates a private, empty directory on the same filesystem as the cache.
    std::filesystem::path create_staging_dir(const std::string& package_name, const std::string& version) const;

    // Atomically moves a fully extracted staging directory into place. Returns
    // false (and removes the staging directory) if another writer published
    // the same package first.
    bool publish(const std::filesystem::path& staging_dir, const std::filesystem::path& package_dir) const;

private:
    std::filesystem::path root_;
};

// Removes a staging directory on scope exit unless it was published.
class StagingDir {
public:
    explicit StagingDir(std::filesystem::path path) : path_(std::move(path)) {}
    ~StagingDir();

    StagingDir(const StagingDir&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    void release() { released_ = true; }

private:
    std::filesystem::path path_;
    bool released_ = false;
};
