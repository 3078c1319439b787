#include "content_type.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>
#include <unordered_set>

namespace {
    const std::unordered_map<std::string, std::string> content_types = {
        {".js", "application/javascript"},
        {".mjs", "application/javascript"},
        {".cjs", "application/javascript"},
        {".jsx", "text/jsx"},
        {".ts", "text/x-typescript"},
        {".tsx", "text/x-typescript"},
        {".json", "application/json"},
        {".map", "application/json"},
        {".css", "text/css"},
        {".less", "text/x-less"},
        {".scss", "text/x-scss"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".xml", "application/xml"},
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".markdown", "text/markdown"},
        {".yml", "text/yaml"},
        {".yaml", "text/yaml"},
        {".svg", "image/svg+xml"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".ico", "image/x-icon"},
        {".webp", "image/webp"},
        {".woff", "font/woff"},
        {".woff2", "font/woff2"},
        {".ttf", "font/ttf"},
        {".otf", "font/otf"},
        {".eot", "application/vnd.ms-fontobject"},
        {".wasm", "application/wasm"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tgz", "application/gzip"},
        {".pdf", "application/pdf"},
    };

    // Extensionless files commonly shipped in packages.
    const std::unordered_set<std::string> text_files = {
        "LICENSE", "LICENCE", "README", "CHANGES", "CHANGELOG", "AUTHORS", "Makefile", "PATENTS",
    };
}

std::string get_content_type(const std::string& file) {
    std::filesystem::path p(file);
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

    auto it = content_types.find(ext);
    if (it != content_types.end()) return it->second;

    if (ext.empty() && text_files.contains(p.filename().string())) return "text/plain";
    return "application/octet-stream";
}
