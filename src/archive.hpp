#pragma once

#include <filesystem>

// Extracts a (compressed) tarball into output_dir, dropping the first
// `strip_components` path components of every entry. Entries that would land
// outside output_dir are rejected. Throws UpstreamError on failure.
void extract_tarball(const std::filesystem::path& archive_path, const std::filesystem::path& output_dir, int strip_components = 1);
