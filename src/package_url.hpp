#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

// A request path of the form /name[@version][/filename][?query].
struct PackageUrl {
    std::string package_name;                 // "react" or "@scope/name"
    std::string version = "latest";           // exact version, dist-tag or range
    std::string filename;                     // "" or "/..." kept verbatim
    std::string search;                       // "" or "?..." kept verbatim
    std::map<std::string, std::string> query; // decoded query parameters
};

// Returns std::nullopt for paths that do not name a package.
std::optional<PackageUrl> parse_package_url(std::string_view url);

// Inverse of parse_package_url. The filename is percent-encoded per segment;
// `search` is appended verbatim.
std::string create_package_url(const std::string& package_name, const std::string& version,
                               const std::string& filename, const std::string& search);
