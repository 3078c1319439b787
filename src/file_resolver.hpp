#pragma once

#include <filesystem>
#include <optional>

// Resolves a path like "lib/file" into "lib/file", "lib/file.js" or
// "lib/file.json", the first of which is a regular file. With use_index set, a
// directory that yields no match is resolved through its own "index" once.
// Throws FilesystemError for stat failures other than "does not exist".
std::optional<std::filesystem::path> resolve_file(const std::filesystem::path& file, bool use_index);

// Joins a package-relative filename onto the package directory. Returns
// std::nullopt when the filename would escape the directory.
std::optional<std::filesystem::path> join_package_path(const std::filesystem::path& package_dir,
                                                       const std::string& filename);

// True if `path`, with every symlink along it resolved, still lies inside
// package_dir. Symlinks may chain through each other, so a lexical check of
// each link target is not enough. Throws FilesystemError if resolution fails.
bool is_within_package(const std::filesystem::path& path, const std::filesystem::path& package_dir);
