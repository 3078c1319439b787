#pragma once

#include <filesystem>
#include <format>
#include <string>
#include <string_view>

// Loads built-in English strings, then overrides them from <l10n_dir>/<lang>.txt
// when such a file exists. The language is taken from LANG.
void init_localization(const std::filesystem::path& l10n_dir = {});
const std::string& get_string(const std::string& key);

// Variadic template for string formatting using modern C++20 std::format
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    try {
        return std::vformat(get_string(key), std::make_format_args(args...));
    } catch (const std::format_error& e) {
        return "Pkgcdn Formatting Error [key: " + key + "]: " + e.what();
    }
}
