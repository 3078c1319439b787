#include "package_url.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <event2/http.h>
#include <event2/keyvalq_struct.h>

#include <cstdlib>
#include <memory>
#include <new>

namespace {
    struct FreeDeleter {
        void operator()(char* p) const { std::free(p); }
    };

    std::optional<std::string> uri_decode(const std::string& text) {
        if (text.find('%') == std::string::npos) return text;

        size_t size = 0;
        std::unique_ptr<char, FreeDeleter> decoded(evhttp_uridecode(text.c_str(), 0, &size));
        if (!decoded) return std::nullopt;
        std::string result(decoded.get(), size);
        if (result.find('\0') != std::string::npos) return std::nullopt;
        return result;
    }

    std::map<std::string, std::string> parse_query(const std::string& search) {
        std::map<std::string, std::string> params;
        if (search.size() <= 1) return params;

        struct evkeyvalq headers;
        if (evhttp_parse_query_str(search.c_str() + 1, &headers) != 0) {
            // Malformed query strings still address the same file.
            log_debug(string_format("debug.query_parse_failed", search));
            evhttp_clear_headers(&headers);
            return params;
        }
        for (struct evkeyval* kv = headers.tqh_first; kv; kv = kv->next.tqe_next) {
            params.emplace(kv->key, kv->value);
        }
        evhttp_clear_headers(&headers);
        return params;
    }

    // Encodes each path segment, keeping the "/" separators.
    std::string encode_path(const std::string& path) {
        std::string encoded;
        size_t start = 0;
        while (true) {
            size_t slash = path.find('/', start);
            std::string segment = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
            if (!segment.empty()) {
                std::unique_ptr<char, FreeDeleter> escaped(evhttp_uriencode(segment.data(), static_cast<ev_ssize_t>(segment.size()), 0));
                if (!escaped) throw std::bad_alloc();
                encoded += escaped.get();
            }
            if (slash == std::string::npos) break;
            encoded += '/';
            start = slash + 1;
        }
        return encoded;
    }

    bool is_valid_name(const std::string& name) {
        if (name.empty()) return false;
        if (name[0] != '@') return name.find('@') == std::string::npos;

        size_t slash = name.find('/');
        if (slash == std::string::npos || slash == 1 || slash == name.size() - 1) return false;
        return name.find('@', 1) == std::string::npos;
    }
}

std::optional<PackageUrl> parse_package_url(std::string_view url) {
    PackageUrl result;

    size_t query_pos = url.find('?');
    std::string pathname(url.substr(0, query_pos));
    if (query_pos != std::string_view::npos) {
        result.search = std::string(url.substr(query_pos));
    }

    if (pathname.size() < 2 || pathname[0] != '/') return std::nullopt;
    std::string rest = pathname.substr(1);

    // The package segment spans two path components for scoped names.
    size_t segment_end = rest.find('/');
    size_t scope_slash = std::string::npos;
    if (rest[0] == '@' && segment_end != std::string::npos) {
        scope_slash = segment_end;
        segment_end = rest.find('/', scope_slash + 1);
    }

    std::string segment = rest.substr(0, segment_end);
    if (segment_end != std::string::npos) {
        result.filename = rest.substr(segment_end);
    }

    size_t at = segment.rfind('@');
    size_t min_at = scope_slash == std::string::npos ? 0 : scope_slash;
    if (at != std::string::npos && at > min_at) {
        result.package_name = segment.substr(0, at);
        std::string version = segment.substr(at + 1);
        if (version.empty()) return std::nullopt;
        auto decoded = uri_decode(version);
        // A version never spans path components, even when percent-encoded.
        if (!decoded || decoded->empty() || decoded->find('/') != std::string::npos) return std::nullopt;
        result.version = std::move(*decoded);
    } else {
        result.package_name = segment;
    }

    if (!is_valid_name(result.package_name)) return std::nullopt;

    auto filename = uri_decode(result.filename);
    if (!filename) return std::nullopt;
    result.filename = std::move(*filename);

    result.query = parse_query(result.search);
    return result;
}

std::string create_package_url(const std::string& package_name, const std::string& version,
                               const std::string& filename, const std::string& search) {
    std::string pathname = "/" + package_name;
    if (!version.empty()) pathname += "@" + version;
    pathname += encode_path(filename);
    pathname += search;
    return pathname;
}
