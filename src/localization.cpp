#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fs = std::filesystem;

namespace {
    const std::unordered_map<std::string, std::string> default_strings = {
        {"info.log_prefix", "==> "},
        {"warning.prefix", "Warning:"},
        {"error.prefix", "Error:"},
        {"debug.prefix", "Debug:"},

        {"info.description", "Serves files from registry package tarballs over HTTP"},
        {"info.server_listening", "Listening on {}:{} (registry {})"},
        {"info.server_stopped", "Server stopped"},
        {"info.shutdown_signal", "Shutdown requested"},
        {"info.access_log", "{} {} -> {}"},
        {"info.fetching_tarball", "Fetching {}@{} from {}"},
        {"info.package_cached", "Cached {}@{}"},

        {"help.help", "Print this help"},
        {"help.config", "Read settings from a key = value config file"},
        {"help.registry", "Registry base URL"},
        {"help.bundle_path", "Pseudo-file name that serves a package bundle"},
        {"help.redirect_ttl", "Cache lifetime of version redirects in seconds (0 = none)"},
        {"help.no_auto_index", "Do not generate JSON listings for directories"},
        {"help.max_depth", "Maximum depth of directory listings (negative = unlimited)"},
        {"help.cache_dir", "Directory that holds extracted packages"},
        {"help.bind", "Address to listen on"},
        {"help.port", "Port to listen on"},
        {"help.mount_path", "URL prefix the server is mounted under"},
        {"help.workers", "Number of request worker threads"},
        {"help.verbose", "Enable debug logging"},

        {"debug.config_loaded", "Loaded configuration from {}"},
        {"debug.query_parse_failed", "Ignoring malformed query string {}"},
        {"debug.http_get", "GET {} -> {}"},
        {"debug.extract_complete", "Extracted {} ({} entries)"},
        {"debug.cache_published", "Published {}"},
        {"debug.cache_hit", "Cache hit for {}"},
        {"debug.version_resolved", "Resolved {} to {}"},

        {"warning.publish_race", "{} was published by a concurrent request"},
        {"warning.staging_cleanup_failed", "Could not remove staging directory {}: {}"},
        {"warning.skip_escaping_symlink", "Skipping symlink {} -> {} pointing outside the package"},
        {"warning.skip_symlink_hardlink", "Skipping hardlink {} to symlink {}"},
        {"warning.unsupported_integrity", "No supported algorithm in integrity {}"},

        {"error.unknown", "unknown error"},
        {"error.cmd_parse_error", "Invalid command line: {}"},
        {"error.pkgcdn_error", "{}"},
        {"error.unexpected_error", "Unexpected error: {}"},
        {"error.request_failed", "Request {} failed: {}"},
        {"error.no_response", "Request {} produced no response"},
        {"error.response_already_sent", "A response was already sent for this request"},
        {"error.manifest_not_object", "package.json is not a JSON object"},

        {"error.config_syntax", "{}:{}: expected key = value"},
        {"error.config_unknown_key", "Unknown configuration key: {}"},
        {"error.config_invalid_number", "Invalid number for {}: {}"},
        {"error.config_invalid_bool", "Invalid boolean for {}: {}"},
        {"error.config_empty_registry", "The registry URL must not be empty"},
        {"error.config_bad_bundle_path", "The bundle path must start with '/': {}"},
        {"error.config_bad_mount_path", "The mount path must start with '/': {}"},
        {"error.config_negative_ttl", "The redirect TTL must not be negative"},
        {"error.config_bad_port", "Invalid port: {}"},
        {"error.config_bad_workers", "At least one worker thread is required"},
        {"error.config_empty_cache_dir", "The cache directory must not be empty"},

        {"error.create_dir_failed", "Failed to create directory {}"},
        {"error.create_file_failed", "Failed to create file {}"},
        {"error.path_not_dir", "{} exists but is not a directory"},
        {"error.open_file_failed", "Failed to open {}"},
        {"error.read_file_failed", "Failed to read {}"},
        {"error.read_dir_failed", "Failed to list {}: {}"},
        {"error.stat_failed", "Failed to stat {}: {}"},
        {"error.path_traversal", "Path escapes the package: {}"},
        {"error.publish_failed", "Failed to publish {}: {}"},

        {"error.download_failed", "Failed to download {}"},
        {"error.registry_status", "Registry returned status {1} for package {0}"},
        {"error.registry_bad_info", "Unable to retrieve info for package {}"},
        {"error.registry_no_tarball", "No tarball listed for {}@{}"},
        {"error.json_parse_failed", "Invalid JSON in {}: {}"},
        {"error.integrity_mismatch", "Integrity check failed for {}"},
        {"error.shasum_mismatch", "Checksum mismatch for {}"},
        {"error.openssl_ctx_failed", "Failed to create digest context"},
        {"error.openssl_init_failed", "Failed to initialize digest"},
        {"error.openssl_update_failed", "Failed to update digest"},
        {"error.openssl_final_failed", "Failed to finalize digest"},

        {"error.extract_failed", "Failed to extract {}"},
        {"error.fatal_read", "fatal read error"},
        {"error.fatal_write", "fatal write error"},
        {"error.data_block_read", "failed to read data block"},
        {"error.data_block_write", "failed to write data block"},
        {"error.malicious_path_in_archive", "Refusing unsafe archive path {}"},

        {"error.event_threads_failed", "Failed to enable libevent threading"},
        {"error.event_base_failed", "Failed to create event base"},
        {"error.evhttp_failed", "Failed to create HTTP server"},
        {"error.signal_setup_failed", "Failed to install signal handlers"},
        {"error.bind_failed", "Failed to bind {}:{}: {}"},
        {"error.event_loop_failed", "Event loop terminated with an error"},
        {"error.bad_header", "Refusing response header {}: {}"},
        {"error.evbuffer_failed", "Failed to allocate response buffer"},
        {"error.post_completion_failed", "Failed to hand response for {} back to the event loop"},
    };

    std::unordered_map<std::string, std::string> translations = default_strings;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::mutex missing_mutex;

    bool load_strings(const fs::path& l10n_dir, const std::string& lang) {
        std::ifstream file(l10n_dir / (lang + ".txt"));
        if (!file.is_open()) return false;

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                translations[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
        return true;
    }
}

void init_localization(const fs::path& l10n_dir) {
    translations = default_strings;
    if (l10n_dir.empty()) return;

    const char* lang_env = std::getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).size() >= 2) {
        lang = std::string(lang_env).substr(0, 2);
    }
    if (!load_strings(l10n_dir, lang) && lang != "en") {
        load_strings(l10n_dir, "en");
    }
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    std::lock_guard<std::mutex> lock(missing_mutex);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
