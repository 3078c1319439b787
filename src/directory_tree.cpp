#include "directory_tree.hpp"
#include "content_type.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <future>

namespace fs = std::filesystem;

namespace {
    constexpr size_t stat_batch_size = 32;

    struct stat get_stats(const fs::path& file) {
        struct stat st;
        if (lstat(file.c_str(), &st) != 0) {
            throw FilesystemError(string_format("error.stat_failed", file.string(), std::strerror(errno)));
        }
        return st;
    }

    EntryType get_type(const struct stat& st) {
        if (S_ISREG(st.st_mode)) return EntryType::FILE;
        if (S_ISDIR(st.st_mode)) return EntryType::DIRECTORY;
        if (S_ISBLK(st.st_mode)) return EntryType::BLOCK_DEVICE;
        if (S_ISCHR(st.st_mode)) return EntryType::CHARACTER_DEVICE;
        if (S_ISLNK(st.st_mode)) return EntryType::SYMLINK;
        if (S_ISFIFO(st.st_mode)) return EntryType::FIFO;
        if (S_ISSOCK(st.st_mode)) return EntryType::SOCKET;
        return EntryType::UNKNOWN;
    }

    fs::path to_disk_path(const fs::path& base_dir, const std::string& relative) {
        return base_dir / fs::path(relative).relative_path();
    }

    std::string child_path(const std::string& parent, const std::string& name) {
        if (parent.empty() || parent.back() != '/') return parent + "/" + name;
        return parent + name;
    }

    FileSystemEntry resolve_entry(const fs::path& base_dir, const std::string& path, const struct stat& st, int max_depth);

    std::vector<FileSystemEntry> get_entries(const fs::path& base_dir, const std::string& name, int max_depth) {
        fs::path dir = to_disk_path(base_dir, name);

        std::vector<std::string> files;
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            throw FilesystemError(string_format("error.read_dir_failed", dir.string(), ec.message()));
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            files.push_back(it->path().filename().string());
        }
        if (ec) {
            throw FilesystemError(string_format("error.read_dir_failed", dir.string(), ec.message()));
        }

        // Stat the whole level concurrently before descending.
        std::vector<struct stat> stats;
        stats.reserve(files.size());
        for (size_t start = 0; start < files.size(); start += stat_batch_size) {
            size_t end = std::min(files.size(), start + stat_batch_size);
            std::vector<std::future<struct stat>> futures;
            for (size_t i = start; i < end; ++i) {
                futures.push_back(std::async(std::launch::async, get_stats, dir / files[i]));
            }
            for (auto& fut : futures) {
                stats.push_back(fut.get());
            }
        }

        std::vector<FileSystemEntry> entries;
        entries.reserve(files.size());
        for (size_t i = 0; i < files.size(); ++i) {
            entries.push_back(resolve_entry(base_dir, child_path(name, files[i]), stats[i], max_depth));
        }
        return entries;
    }

    FileSystemEntry resolve_entry(const fs::path& base_dir, const std::string& path, const struct stat& st, int max_depth) {
        FileSystemEntry entry;
        entry.path = path;
        entry.last_modified = format_iso8601(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
        entry.content_type = get_content_type(path);
        entry.size = static_cast<long long>(st.st_size);
        entry.type = get_type(st);

        if (entry.type == EntryType::DIRECTORY && max_depth > 0) {
            entry.children = get_entries(base_dir, path, max_depth - 1);
        }
        return entry;
    }
}

const char* entry_type_name(EntryType type) {
    switch (type) {
        case EntryType::FILE: return "file";
        case EntryType::DIRECTORY: return "directory";
        case EntryType::BLOCK_DEVICE: return "blockDevice";
        case EntryType::CHARACTER_DEVICE: return "characterDevice";
        case EntryType::SYMLINK: return "symlink";
        case EntryType::FIFO: return "fifo";
        case EntryType::SOCKET: return "socket";
        default: return "unknown";
    }
}

FileSystemEntry build_directory_tree(const fs::path& base_dir, const std::string& relative_path, int max_depth) {
    std::string path = relative_path.empty() ? "/" : relative_path;
    while (path.size() > 1 && path.back() == '/') path.pop_back();

    struct stat st = get_stats(to_disk_path(base_dir, path));
    return resolve_entry(base_dir, path, st, max_depth);
}

Json::Value directory_tree_to_json(const FileSystemEntry& entry) {
    Json::Value json(Json::objectValue);
    json["path"] = entry.path;
    json["lastModified"] = entry.last_modified;
    json["contentType"] = entry.content_type;
    json["size"] = static_cast<Json::Int64>(entry.size);
    json["type"] = entry_type_name(entry.type);

    if (entry.type == EntryType::DIRECTORY) {
        if (entry.children) {
            Json::Value children(Json::arrayValue);
            for (const auto& child : *entry.children) {
                children.append(directory_tree_to_json(child));
            }
            json["children"] = children;
        } else {
            json["children"] = Json::Value(Json::nullValue);
        }
    }
    return json;
}
