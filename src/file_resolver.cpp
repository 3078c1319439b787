#include "file_resolver.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <array>
#include <string>

namespace fs = std::filesystem;

namespace {
    const std::array<std::string, 3> resolve_extensions = {"", ".js", ".json"};

    // std::nullopt when the path does not exist.
    std::optional<fs::file_status> stat_path(const fs::path& path) {
        std::error_code ec;
        fs::file_status status = fs::status(path, ec);
        if (status.type() == fs::file_type::not_found) return std::nullopt;
        if (ec) {
            throw FilesystemError(string_format("error.stat_failed", path.string(), ec.message()));
        }
        return status;
    }
}

std::optional<fs::path> resolve_file(const fs::path& file, bool use_index) {
    for (const auto& ext : resolve_extensions) {
        fs::path candidate = file.string() + ext;
        auto status = stat_path(candidate);
        if (status && fs::is_regular_file(*status)) {
            return candidate;
        }
    }

    if (use_index) {
        auto status = stat_path(file);
        if (status && fs::is_directory(*status)) {
            return resolve_file(file / "index", false);
        }
    }

    return std::nullopt;
}

bool is_within_package(const fs::path& path, const fs::path& package_dir) {
    std::error_code ec;
    fs::path root = fs::canonical(package_dir, ec);
    if (ec) {
        throw FilesystemError(string_format("error.stat_failed", package_dir.string(), ec.message()));
    }
    fs::path resolved = fs::weakly_canonical(path, ec);
    if (ec) {
        throw FilesystemError(string_format("error.stat_failed", path.string(), ec.message()));
    }

    auto r = root.begin();
    auto p = resolved.begin();
    for (; r != root.end(); ++r, ++p) {
        if (p == resolved.end() || *p != *r) return false;
    }
    return true;
}

std::optional<fs::path> join_package_path(const fs::path& package_dir, const std::string& filename) {
    try {
        return validate_path(fs::path(filename), package_dir);
    } catch (const PkgcdnException& e) {
        log_warning(e.what());
        return std::nullopt;
    }
}
