#include "cache.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "registry.hpp"
#include "request_handler.hpp"
#include "server.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>
#include <curl/curl.h>

#include <csignal>
#include <iostream>
#include <string>

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

void apply_options(const cxxopts::ParseResult& result, CdnConfig& config) {
    if (result.count("registry")) config.registry_url = result["registry"].as<std::string>();
    if (result.count("bundle-path")) config.bundle_path = result["bundle-path"].as<std::string>();
    if (result.count("redirect-ttl")) config.redirect_ttl = result["redirect-ttl"].as<long long>();
    if (result.count("no-auto-index")) config.auto_index = !result["no-auto-index"].as<bool>();
    if (result.count("max-depth")) config.maximum_depth = result["max-depth"].as<int>();
    if (result.count("cache-dir")) config.cache_dir = result["cache-dir"].as<std::string>();
    if (result.count("bind")) config.bind_address = result["bind"].as<std::string>();
    if (result.count("port")) config.port = result["port"].as<int>();
    if (result.count("mount-path")) config.mount_path = result["mount-path"].as<std::string>();
    if (result.count("workers")) config.workers = result["workers"].as<int>();
    if (result.count("verbose")) config.verbose = result["verbose"].as<bool>();
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    std::signal(SIGPIPE, SIG_IGN);

    try {
        init_localization(PKGCDN_L10N_DIR);

        cxxopts::Options options(argv[0], get_string("info.description"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("c,config", get_string("help.config"), cxxopts::value<std::string>())
            ("registry", get_string("help.registry"), cxxopts::value<std::string>())
            ("bundle-path", get_string("help.bundle_path"), cxxopts::value<std::string>())
            ("redirect-ttl", get_string("help.redirect_ttl"), cxxopts::value<long long>())
            ("no-auto-index", get_string("help.no_auto_index"), cxxopts::value<bool>()->default_value("false"))
            ("max-depth", get_string("help.max_depth"), cxxopts::value<int>())
            ("cache-dir", get_string("help.cache_dir"), cxxopts::value<std::string>())
            ("b,bind", get_string("help.bind"), cxxopts::value<std::string>())
            ("p,port", get_string("help.port"), cxxopts::value<int>())
            ("mount-path", get_string("help.mount_path"), cxxopts::value<std::string>())
            ("w,workers", get_string("help.workers"), cxxopts::value<int>())
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"));

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        CdnConfig config;
        if (result.count("config")) {
            load_config_file(result["config"].as<std::string>(), config);
        }
        apply_options(result, config);
        validate_config(config);

        set_verbose_mode(config.verbose);
        if (config.l10n_dir != PKGCDN_L10N_DIR) {
            init_localization(config.l10n_dir);
        }

        ensure_dir_exists(config.cache_dir);

        PackageCache cache(config.cache_dir);
        Registry registry(config.registry_url, TransferOptions{config.connect_timeout, config.request_timeout});
        RequestHandler handler(config, registry, cache);

        CdnServer server(config, handler);
        server.run();

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const PkgcdnException& e) {
        log_error(string_format("error.pkgcdn_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
