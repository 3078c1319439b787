#pragma once

#include "exception.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_CYAN = "\033[1;36m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_debug(std::string_view msg);

void set_verbose_mode(bool enable);

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
std::string read_file_to_string(const fs::path& path);

// Joins a package-relative path onto root. Throws PkgcdnException if the
// normalized result would leave root.
fs::path validate_path(const fs::path& path, const fs::path& root);

// Time formatting
std::string format_iso8601(long long seconds, long nanoseconds);
std::string format_http_date(long long seconds);
