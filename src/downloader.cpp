#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <fstream>
#include <memory>
#include <ostream>

namespace fs = std::filesystem;

namespace {
    const char* user_agent = "pkgcdn/" PKGCDN_VERSION;

    size_t write_data_cpp(void* ptr, size_t size, size_t nmemb, void* stream) {
        std::ostream* out = static_cast<std::ostream*>(stream);
        size_t bytes = size * nmemb;
        out->write(static_cast<char*>(ptr), bytes);
        return out->good() ? bytes : 0;
    }

    size_t write_string(void* ptr, size_t size, size_t nmemb, void* userdata) {
        std::string* out = static_cast<std::string*>(userdata);
        size_t bytes = size * nmemb;
        out->append(static_cast<char*>(ptr), bytes);
        return bytes;
    }

    // Custom deleter for the CURL handle
    struct CurlDeleter {
        void operator()(CURL* curl) const {
            if (curl) {
                curl_easy_cleanup(curl);
            }
        }
    };
    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

    CurlHandle make_handle(const std::string& url, const TransferOptions& options) {
        CurlHandle curl(curl_easy_init());
        if (!curl) {
            throw UpstreamError(string_format("error.download_failed", url));
        }
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options.connect_timeout);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options.request_timeout);
        return curl;
    }

    bool is_file_url(const std::string& url) {
        return url.rfind("file://", 0) == 0;
    }
}

HttpResponse http_get(const std::string& url, const TransferOptions& options) {
    CurlHandle curl = make_handle(url, options);

    HttpResponse response;
    struct curl_slist* headers = curl_slist_append(nullptr, "Accept: application/json");
    std::unique_ptr<struct curl_slist, decltype(&curl_slist_free_all)> header_list(headers, &curl_slist_free_all);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_FILE_COULDNT_READ_FILE && is_file_url(url)) {
        response.status = 404;
        response.body.clear();
        return response;
    }
    if (res != CURLE_OK) {
        throw UpstreamError(string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (response.status == 0 && is_file_url(url)) response.status = 200;
    log_debug(string_format("debug.http_get", url, response.status));
    return response;
}

void download_file(const std::string& url, const fs::path& output_path, const TransferOptions& options) {
    CurlHandle curl = make_handle(url, options);

    CURLcode res;
    {
        std::ofstream ofile(output_path, std::ios::binary);
        if (!ofile) {
            throw UpstreamError(string_format("error.create_file_failed", output_path.string()));
        }

        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_data_cpp);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ofile);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);

        res = curl_easy_perform(curl.get());
    }

    if (res != CURLE_OK) {
        std::error_code ec;
        fs::remove(output_path, ec);
        throw UpstreamError(string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }
}
