#pragma once

#include <filesystem>
#include <string>

std::string calculate_sha1(const std::filesystem::path& file_path);

// Checks a downloaded tarball against the registry's "dist.integrity" (SRI,
// e.g. "sha512-<base64>") or, failing that, its hex "dist.shasum". Empty
// strings skip the corresponding check. Throws UpstreamError on mismatch.
void verify_tarball(const std::filesystem::path& file_path, const std::string& integrity, const std::string& shasum);
