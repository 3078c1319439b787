#pragma once

#include "downloader.hpp"

#include <json/json.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

class PackageCache;

// Registry metadata for one package.
struct PackageInfo {
    std::string name;
    Json::Value versions;                          // version -> package manifest
    std::map<std::string, std::string> dist_tags;  // tag -> version

    bool has_version(const std::string& version) const;
    std::vector<std::string> version_list() const;
};

class Registry {
public:
    Registry(std::string registry_url, TransferOptions options);

    // std::nullopt if the registry does not know the package. Transport
    // failures and malformed metadata throw UpstreamError.
    std::optional<PackageInfo> get_package_info(const std::string& package_name) const;

    // Downloads, verifies and extracts the tarball of one version into the
    // cache. On failure nothing is published and UpstreamError is thrown.
    void fetch_package(const PackageInfo& info, const std::string& version, const PackageCache& cache) const;

    std::string package_info_url(const std::string& package_name) const;

private:
    std::string registry_url_;
    TransferOptions options_;
};
