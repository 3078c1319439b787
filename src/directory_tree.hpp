#pragma once

#include <json/json.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

enum class EntryType {
    FILE,
    DIRECTORY,
    BLOCK_DEVICE,
    CHARACTER_DEVICE,
    SYMLINK,
    FIFO,
    SOCKET,
    UNKNOWN
};

struct FileSystemEntry {
    std::string path;          // relative to the package root, e.g. "/lib/index.js"
    std::string last_modified; // ISO-8601, UTC
    std::string content_type;
    long long size = 0;
    EntryType type = EntryType::UNKNOWN;
    // Only set for directories that were expanded; an unexpanded directory has
    // no children at all, which is different from an empty one.
    std::optional<std::vector<FileSystemEntry>> children;
};

const char* entry_type_name(EntryType type);

// Walks base_dir/relative_path, expanding directories up to max_depth levels.
// Children appear in directory listing order. Any failed stat or listing throws
// FilesystemError; there are no partial trees.
FileSystemEntry build_directory_tree(const std::filesystem::path& base_dir, const std::string& relative_path, int max_depth);

Json::Value directory_tree_to_json(const FileSystemEntry& entry);
