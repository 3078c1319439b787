#include "response.hpp"
#include "content_type.hpp"
#include "exception.hpp"
#include "json_utils.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <strings.h>
#include <sys/stat.h>

#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;

namespace {
    std::string cache_control(long long max_age) {
        return "public, max-age=" + std::to_string(max_age);
    }
}

void Responder::send_not_found(const std::string& what) {
    send_text(404, "Not found: " + what);
}

void Responder::send_invalid_url(const std::string& url) {
    send_text(403, "Invalid URL: " + url);
}

void Responder::send_server_error(const std::string& cause) {
    log_error(cause);
    send_text(500, "Server error");
}

const std::string* Response::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) return &value;
    }
    return nullptr;
}

void BufferedResponder::begin(int status) {
    if (sent_) {
        throw PkgcdnException(get_string("error.response_already_sent"));
    }
    response_ = Response{};
    response_.status = status;
}

void BufferedResponder::send_file(const fs::path& file, long long max_age) {
    struct stat st;
    if (stat(file.c_str(), &st) != 0) {
        throw FilesystemError(string_format("error.stat_failed", file.string(), std::strerror(errno)));
    }

    begin(200);
    response_.headers.emplace_back("Content-Type", get_content_type(file.string()));
    response_.headers.emplace_back("Content-Length", std::to_string(st.st_size));
    response_.headers.emplace_back("Cache-Control", cache_control(max_age));
    response_.headers.emplace_back("Last-Modified", format_http_date(st.st_mtim.tv_sec));
    response_.headers.emplace_back("ETag", "\"" + std::to_string(st.st_size) + "-" + std::to_string(st.st_mtim.tv_sec) + "\"");
    response_.file = file;
    response_.file_size = static_cast<long long>(st.st_size);
    sent_ = true;
}

void BufferedResponder::send_redirect(const std::string& location, long long max_age) {
    begin(302);
    response_.body = "<p>You are being redirected to <a href=\"" + location + "\">" + location + "</a></p>";
    response_.headers.emplace_back("Location", location);
    response_.headers.emplace_back("Content-Type", "text/html");
    response_.headers.emplace_back("Content-Length", std::to_string(response_.body.size()));
    if (max_age > 0) {
        response_.headers.emplace_back("Cache-Control", cache_control(max_age));
    }
    sent_ = true;
}

void BufferedResponder::send_json(const Json::Value& value, long long max_age) {
    begin(200);
    response_.body = to_json_string(value);
    response_.headers.emplace_back("Content-Type", "application/json");
    response_.headers.emplace_back("Content-Length", std::to_string(response_.body.size()));
    response_.headers.emplace_back("Cache-Control", cache_control(max_age));
    sent_ = true;
}

void BufferedResponder::send_text(int status, const std::string& message) {
    begin(status);
    response_.body = message;
    response_.headers.emplace_back("Content-Type", "text/plain");
    response_.headers.emplace_back("Content-Length", std::to_string(message.size()));
    sent_ = true;
}
