#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <charconv>
#include <climits>
#include <fstream>
#include <limits>

namespace fs = std::filesystem;

namespace {
    std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t\r");
        return s.substr(start, end - start + 1);
    }

    long long parse_integer(const std::string& key, const std::string& value) {
        long long result = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
        if (ec != std::errc() || ptr != value.data() + value.size()) {
            throw PkgcdnException(string_format("error.config_invalid_number", key, value));
        }
        return result;
    }

    // Rejects values that do not fit the target field instead of wrapping.
    template<typename T>
    T parse_integer_as(const std::string& key, const std::string& value) {
        long long result = parse_integer(key, value);
        if (result < std::numeric_limits<T>::min() || result > std::numeric_limits<T>::max()) {
            throw PkgcdnException(string_format("error.config_invalid_number", key, value));
        }
        return static_cast<T>(result);
    }

    bool parse_bool(const std::string& key, const std::string& value) {
        if (value == "true" || value == "yes" || value == "on" || value == "1") return true;
        if (value == "false" || value == "no" || value == "off" || value == "0") return false;
        throw PkgcdnException(string_format("error.config_invalid_bool", key, value));
    }
}

fs::path CdnConfig::default_cache_dir() {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return tmp / "pkgcdn";
}

void apply_config_value(CdnConfig& config, const std::string& key, const std::string& value) {
    if (key == "registry_url") {
        config.registry_url = value;
    } else if (key == "bundle_path") {
        config.bundle_path = value;
    } else if (key == "redirect_ttl") {
        config.redirect_ttl = parse_integer(key, value);
    } else if (key == "auto_index") {
        config.auto_index = parse_bool(key, value);
    } else if (key == "maximum_depth") {
        config.maximum_depth = parse_integer_as<int>(key, value);
    } else if (key == "cache_dir") {
        config.cache_dir = value;
    } else if (key == "bind_address") {
        config.bind_address = value;
    } else if (key == "port") {
        config.port = parse_integer_as<int>(key, value);
    } else if (key == "mount_path") {
        config.mount_path = value;
    } else if (key == "workers") {
        config.workers = parse_integer_as<int>(key, value);
    } else if (key == "connect_timeout") {
        config.connect_timeout = parse_integer_as<long>(key, value);
    } else if (key == "request_timeout") {
        config.request_timeout = parse_integer_as<long>(key, value);
    } else if (key == "l10n_dir") {
        config.l10n_dir = value;
    } else if (key == "verbose") {
        config.verbose = parse_bool(key, value);
    } else {
        throw PkgcdnException(string_format("error.config_unknown_key", key));
    }
}

void load_config_file(const fs::path& path, CdnConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PkgcdnException(string_format("error.open_file_failed", path.string()));
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            throw PkgcdnException(string_format("error.config_syntax", path.string(), line_number));
        }
        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));
        apply_config_value(config, key, value);
    }
    log_debug(string_format("debug.config_loaded", path.string()));
}

void validate_config(const CdnConfig& config) {
    if (config.registry_url.empty()) {
        throw PkgcdnException(get_string("error.config_empty_registry"));
    }
    if (config.bundle_path.empty() || config.bundle_path.front() != '/') {
        throw PkgcdnException(string_format("error.config_bad_bundle_path", config.bundle_path));
    }
    if (config.mount_path.empty() || config.mount_path.front() != '/') {
        throw PkgcdnException(string_format("error.config_bad_mount_path", config.mount_path));
    }
    if (config.redirect_ttl < 0) {
        throw PkgcdnException(get_string("error.config_negative_ttl"));
    }
    if (config.port < 0 || config.port > 65535) {
        throw PkgcdnException(string_format("error.config_bad_port", config.port));
    }
    if (config.workers <= 0) {
        throw PkgcdnException(get_string("error.config_bad_workers"));
    }
    if (config.cache_dir.empty()) {
        throw PkgcdnException(get_string("error.config_empty_cache_dir"));
    }
}

int effective_maximum_depth(const CdnConfig& config) {
    return config.maximum_depth < 0 ? INT_MAX : config.maximum_depth;
}
