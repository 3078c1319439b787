#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct SemVer {
    long long major = 0;
    long long minor = 0;
    long long patch = 0;
    std::vector<std::string> prerelease;

    std::string to_string() const;
};

// Parses "1.2.3", "v1.2.3-beta.1+build" and similar. Build metadata is ignored.
std::optional<SemVer> parse_semver(std::string_view text);

// Semver precedence: negative, zero or positive.
int compare_semver(const SemVer& a, const SemVer& b);

// True if v1 sorts strictly before v2. Invalid versions sort first.
bool version_compare(const std::string& v1_str, const std::string& v2_str);

// npm range semantics ("^1.2", "~1", "1.x", ">=1 <2", "1 - 2", "a || b").
// An unparsable range is satisfied by nothing.
bool version_satisfies(const std::string& version, const std::string& range);

// Highest version in `versions` satisfying `range`, if any.
std::optional<std::string> max_satisfying(const std::vector<std::string>& versions, const std::string& range);
