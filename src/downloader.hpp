#pragma once

#include <filesystem>
#include <string>

struct TransferOptions {
    long connect_timeout = 10;  // seconds
    long request_timeout = 120; // seconds, whole transfer
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Fetches a URL into memory. Any completed HTTP exchange is returned with its
// status; an unreadable file:// path reports 404. Transport failures throw
// UpstreamError.
HttpResponse http_get(const std::string& url, const TransferOptions& options);

// Streams a URL to output_path. Non-2xx responses and transport failures throw
// UpstreamError; a partially written file is removed.
void download_file(const std::string& url, const std::filesystem::path& output_path, const TransferOptions& options);
