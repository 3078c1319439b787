#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <sys/stat.h>

#include <memory>
#include <optional>
#include <set>
#include <string>

namespace fs = std::filesystem;

// Custom deleters for libarchive handles
struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

namespace {
    // "package/lib/index.js" -> "lib/index.js" for strip = 1.
    std::optional<fs::path> strip_path(const std::string& entry_path, int strip) {
        fs::path stripped;
        int index = 0;
        for (const auto& component : fs::path(entry_path).relative_path()) {
            if (component == "." || component.empty()) continue;
            if (index++ < strip) continue;
            stripped /= component;
        }
        if (stripped.empty()) return std::nullopt;
        return stripped;
    }

    // Lexical check of a single link. Chains of links are caught when a path is
    // served, by resolving it against the package directory.
    bool escapes_package(const fs::path& link_path, const std::string& target) {
        fs::path t(target);
        if (t.is_absolute()) return true;
        fs::path resolved = (link_path.parent_path() / t).lexically_normal();
        return !resolved.empty() && *resolved.begin() == "..";
    }

    [[noreturn]] void fail(const fs::path& archive_path, struct archive* a, const std::string& fallback_key) {
        const char* err = archive_error_string(a);
        throw UpstreamError(string_format("error.extract_failed", archive_path.string()) + ": " + (err ? err : get_string(fallback_key)));
    }
}

void extract_tarball(const fs::path& archive_path, const fs::path& output_dir, int strip_components) {
    ArchiveReadHandle a(archive_read_new());
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    ArchiveWriteHandle ext(archive_write_disk_new());
    archive_write_disk_set_options(ext.get(),
        ARCHIVE_EXTRACT_TIME |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT |
        ARCHIVE_EXTRACT_UNLINK
    );

    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        fail(archive_path, a.get(), "error.unknown");
    }

    struct archive_entry* entry;
    int r = ARCHIVE_OK;
    long long count = 0;
    std::set<fs::path> symlinks;
    while (true) {
        r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                fail(archive_path, a.get(), "error.fatal_read");
            }
            log_warning(archive_error_string(a.get()));
        }

        const char* current_path = archive_entry_pathname(entry);
        if (!current_path) continue;

        auto stripped = strip_path(current_path, strip_components);
        if (!stripped) {
            archive_read_data_skip(a.get());
            continue;
        }

        // SECURITY: Path traversal vulnerability mitigation.
        fs::path dest_path;
        try {
            dest_path = validate_path(*stripped, output_dir);
        } catch (const PkgcdnException&) {
            throw UpstreamError(string_format("error.malicious_path_in_archive", current_path));
        }
        archive_entry_set_pathname(entry, dest_path.c_str());

        const char* hardlink = archive_entry_hardlink(entry);
        if (hardlink) {
            auto link = strip_path(hardlink, strip_components);
            if (!link) {
                throw UpstreamError(string_format("error.malicious_path_in_archive", hardlink));
            }
            // A hardlink to a symlink is a copy of the link at a new location,
            // where its relative target means something else.
            if (symlinks.contains(link->lexically_normal())) {
                log_warning(string_format("warning.skip_symlink_hardlink", current_path, hardlink));
                archive_read_data_skip(a.get());
                continue;
            }
            try {
                fs::path link_dest = validate_path(*link, output_dir);
                archive_entry_set_hardlink(entry, link_dest.c_str());
            } catch (const PkgcdnException&) {
                throw UpstreamError(string_format("error.malicious_path_in_archive", hardlink));
            }
        }

        const char* symlink = archive_entry_symlink(entry);
        if (symlink) {
            symlinks.insert(stripped->lexically_normal());
            if (escapes_package(*stripped, symlink)) {
                log_warning(string_format("warning.skip_escaping_symlink", current_path, symlink));
                archive_read_data_skip(a.get());
                continue;
            }
        }

        // Published tarballs carry arbitrary modes; cached files only need to be readable.
        if (archive_entry_filetype(entry) == AE_IFDIR) {
            archive_entry_set_perm(entry, 0755);
        } else if (archive_entry_filetype(entry) == AE_IFREG) {
            archive_entry_set_perm(entry, 0644);
        }

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                fail(archive_path, ext.get(), "error.fatal_write");
            }
            log_warning(archive_error_string(ext.get()));
        } else {
            const void* buff;
            size_t size;
            la_int64_t offset;
            while (true) {
                r = archive_read_data_block(a.get(), &buff, &size, &offset);
                if (r == ARCHIVE_EOF) break;
                if (r < ARCHIVE_OK) {
                    if (r < ARCHIVE_WARN) {
                        fail(archive_path, a.get(), "error.data_block_read");
                    }
                    log_warning(archive_error_string(a.get()));
                    break;
                }

                if (archive_write_data_block(ext.get(), buff, size, offset) < ARCHIVE_OK) {
                    fail(archive_path, ext.get(), "error.data_block_write");
                }
            }
            if (archive_write_finish_entry(ext.get()) < ARCHIVE_WARN) {
                fail(archive_path, ext.get(), "error.fatal_write");
            }
        }
        ++count;
    }

    log_debug(string_format("debug.extract_complete", archive_path.filename().string(), count));
}
