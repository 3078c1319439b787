#pragma once

#include <filesystem>
#include <string>

inline constexpr long long ONE_MINUTE = 60;
inline constexpr long long ONE_DAY = ONE_MINUTE * 60 * 24;
inline constexpr long long ONE_YEAR = ONE_DAY * 365;

// Static server configuration. Read once at startup and passed explicitly to
// every component that needs it.
struct CdnConfig {
    std::string registry_url = "https://registry.npmjs.org";
    std::string bundle_path = "/bower.zip";
    long long redirect_ttl = 0;
    bool auto_index = true;
    int maximum_depth = -1; // negative means unlimited
    std::filesystem::path cache_dir = default_cache_dir();

    std::string bind_address = "0.0.0.0";
    int port = 8080;
    std::string mount_path = "/";
    int workers = 8;

    long connect_timeout = 10;
    long request_timeout = 120;

    std::filesystem::path l10n_dir = PKGCDN_L10N_DIR;
    bool verbose = false;

    static std::filesystem::path default_cache_dir();
};

// Applies `key = value` lines from a config file on top of `config`.
void load_config_file(const std::filesystem::path& path, CdnConfig& config);
void apply_config_value(CdnConfig& config, const std::string& key, const std::string& value);
void validate_config(const CdnConfig& config);

// Depth budget handed to the directory tree builder.
int effective_maximum_depth(const CdnConfig& config);
