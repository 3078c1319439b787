#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <ctime>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>

namespace {
    bool verbose_mode = false;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_debug(std::string_view msg) {
    if (!verbose_mode) return;
    log_internal(get_string("debug.prefix") + " ", COLOR_CYAN, msg, std::cout);
}

void set_verbose_mode(bool enable) {
    verbose_mode = enable;
}

void ensure_dir_exists(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (!fs::create_directories(path, ec) && ec) {
            throw PkgcdnException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path, ec)) {
        throw PkgcdnException(string_format("error.path_not_dir", path.string()));
    }
}

std::string read_file_to_string(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FilesystemError(string_format("error.open_file_failed", path.string()));
    }
    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        throw FilesystemError(string_format("error.read_file_failed", path.string()));
    }
    return content;
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    // Package paths arrive rooted at the package ("/lib/foo.js").
    fs::path relative = path.relative_path();

    fs::path normalized = relative.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw PkgcdnException(string_format("error.path_traversal", path.string()));
        }
    }
    if (normalized.empty() || normalized == ".") return root;
    return root / normalized;
}

std::string format_iso8601(long long seconds, long nanoseconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec, nanoseconds / 1000000);
}

std::string format_http_date(long long seconds) {
    static constexpr const char* days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static constexpr const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                             "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return std::format("{}, {:02} {} {:04} {:02}:{:02}:{:02} GMT",
        days[tm.tm_wday], tm.tm_mday, months[tm.tm_mon], tm.tm_year + 1900,
        tm.tm_hour, tm.tm_min, tm.tm_sec);
}
