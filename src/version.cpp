#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>

namespace {
    enum class Op { ANY, EQ, LT, LTE, GT, GTE };

    struct Comparator {
        Op op = Op::ANY;
        SemVer version;
    };

    using ComparatorSet = std::vector<Comparator>;
    using Range = std::vector<ComparatorSet>;

    // A version with wildcard components, e.g. "1.x" or "2".
    struct Partial {
        std::optional<long long> major;
        std::optional<long long> minor;
        std::optional<long long> patch;
        std::vector<std::string> prerelease;
    };

    bool is_numeric(const std::string& s) {
        return !s.empty() && std::all_of(s.begin(), s.end(), ::isdigit);
    }

    std::optional<long long> to_number(const std::string& s) {
        long long value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
        return value;
    }

    std::vector<std::string> split(const std::string& s, char delim) {
        std::vector<std::string> parts;
        std::stringstream ss(s);
        std::string part;
        while (std::getline(ss, part, delim)) parts.push_back(part);
        return parts;
    }

    std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t");
        return s.substr(start, end - start + 1);
    }

    SemVer make_version(long long major, long long minor, long long patch, std::vector<std::string> pre = {}) {
        SemVer v;
        v.major = major;
        v.minor = minor;
        v.patch = patch;
        v.prerelease = std::move(pre);
        return v;
    }

    // "-0" is the lowest possible prerelease, so "<2.0.0-0" excludes all of 2.0.0's prereleases.
    SemVer lowest(long long major, long long minor, long long patch) {
        return make_version(major, minor, patch, {"0"});
    }

    Comparator cmp(Op op, SemVer v) {
        return Comparator{op, std::move(v)};
    }

    // Matches "<1.0.0-0", which nothing satisfies.
    Comparator nothing() {
        return cmp(Op::LT, lowest(0, 0, 0));
    }

    std::optional<Partial> parse_partial(const std::string& text) {
        static const std::regex partial_regex(
            R"(^[v=]*(\d+|[xX*])(?:\.(\d+|[xX*])(?:\.(\d+|[xX*])(?:-([0-9A-Za-z.\-]+))?(?:\+[0-9A-Za-z.\-]+)?)?)?$)");
        std::smatch match;
        if (!std::regex_match(text, match, partial_regex)) return std::nullopt;

        Partial p;
        auto component = [](const std::ssub_match& m) -> std::optional<std::optional<long long>> {
            if (!m.matched) return std::optional<long long>{};
            std::string s = m.str();
            if (s == "x" || s == "X" || s == "*") return std::optional<long long>{};
            auto n = to_number(s);
            if (!n) return std::nullopt;
            return std::optional<long long>{*n};
        };

        auto major = component(match[1]);
        auto minor = component(match[2]);
        auto patch = component(match[3]);
        if (!major || !minor || !patch) return std::nullopt;
        p.major = *major;
        p.minor = p.major ? *minor : std::nullopt;
        p.patch = p.minor ? *patch : std::nullopt;
        if (match[4].matched && p.patch) p.prerelease = split(match[4].str(), '.');
        return p;
    }

    SemVer floor_of(const Partial& p) {
        return make_version(p.major.value_or(0), p.minor.value_or(0), p.patch.value_or(0), p.prerelease);
    }

    void add_xrange(ComparatorSet& set, const Partial& p) {
        if (!p.major) {
            set.push_back(cmp(Op::ANY, {}));
        } else if (!p.minor) {
            set.push_back(cmp(Op::GTE, make_version(*p.major, 0, 0)));
            set.push_back(cmp(Op::LT, lowest(*p.major + 1, 0, 0)));
        } else if (!p.patch) {
            set.push_back(cmp(Op::GTE, make_version(*p.major, *p.minor, 0)));
            set.push_back(cmp(Op::LT, lowest(*p.major, *p.minor + 1, 0)));
        } else {
            set.push_back(cmp(Op::EQ, floor_of(p)));
        }
    }

    void add_tilde(ComparatorSet& set, const Partial& p) {
        if (!p.major) {
            set.push_back(cmp(Op::ANY, {}));
        } else if (!p.minor) {
            set.push_back(cmp(Op::GTE, make_version(*p.major, 0, 0)));
            set.push_back(cmp(Op::LT, lowest(*p.major + 1, 0, 0)));
        } else {
            set.push_back(cmp(Op::GTE, floor_of(p)));
            set.push_back(cmp(Op::LT, lowest(*p.major, *p.minor + 1, 0)));
        }
    }

    void add_caret(ComparatorSet& set, const Partial& p) {
        if (!p.major) {
            set.push_back(cmp(Op::ANY, {}));
            return;
        }
        set.push_back(cmp(Op::GTE, floor_of(p)));
        if (!p.minor || *p.major != 0) {
            set.push_back(cmp(Op::LT, lowest(*p.major + 1, 0, 0)));
        } else if (!p.patch || *p.minor != 0) {
            set.push_back(cmp(Op::LT, lowest(0, *p.minor + 1, 0)));
        } else {
            set.push_back(cmp(Op::LT, lowest(0, 0, *p.patch + 1)));
        }
    }

    void add_primitive(ComparatorSet& set, const std::string& op, const Partial& p) {
        if (!p.major) {
            // ">*" and "<*" match nothing, ">=*" and "<=*" match everything.
            if (op == ">" || op == "<") set.push_back(nothing());
            else set.push_back(cmp(Op::ANY, {}));
            return;
        }

        bool wildcard = !p.minor || !p.patch;
        if (!wildcard) {
            Op o = op == ">" ? Op::GT : op == ">=" ? Op::GTE : op == "<" ? Op::LT : Op::LTE;
            set.push_back(cmp(o, floor_of(p)));
            return;
        }

        long long major = *p.major;
        long long minor = p.minor.value_or(0);
        if (op == ">") {
            if (!p.minor) set.push_back(cmp(Op::GTE, make_version(major + 1, 0, 0)));
            else set.push_back(cmp(Op::GTE, make_version(major, minor + 1, 0)));
        } else if (op == ">=") {
            set.push_back(cmp(Op::GTE, make_version(major, minor, 0)));
        } else if (op == "<") {
            set.push_back(cmp(Op::LT, lowest(major, minor, 0)));
        } else {
            if (!p.minor) set.push_back(cmp(Op::LT, lowest(major + 1, 0, 0)));
            else set.push_back(cmp(Op::LT, lowest(major, minor + 1, 0)));
        }
    }

    bool add_comparator(ComparatorSet& set, const std::string& token) {
        static const std::regex op_regex(R"(^(<=|>=|<|>|=|~>|~|\^)?(.*)$)");
        std::smatch match;
        if (!std::regex_match(token, match, op_regex)) return false;

        std::string op = match[1].str();
        auto partial = parse_partial(match[2].str());
        if (!partial) return false;

        if (op.empty() || op == "=") add_xrange(set, *partial);
        else if (op == "~" || op == "~>") add_tilde(set, *partial);
        else if (op == "^") add_caret(set, *partial);
        else add_primitive(set, op, *partial);
        return true;
    }

    std::optional<ComparatorSet> parse_hyphen(const std::string& from_text, const std::string& to_text) {
        auto from = parse_partial(from_text);
        auto to = parse_partial(to_text);
        if (!from || !to) return std::nullopt;

        ComparatorSet set;
        if (from->major) set.push_back(cmp(Op::GTE, floor_of(*from)));
        if (!to->major) {
            if (set.empty()) set.push_back(cmp(Op::ANY, {}));
        } else if (!to->minor) {
            set.push_back(cmp(Op::LT, lowest(*to->major + 1, 0, 0)));
        } else if (!to->patch) {
            set.push_back(cmp(Op::LT, lowest(*to->major, *to->minor + 1, 0)));
        } else {
            set.push_back(cmp(Op::LTE, floor_of(*to)));
        }
        return set;
    }

    std::optional<ComparatorSet> parse_set(const std::string& text) {
        static const std::regex hyphen_regex(R"(^\s*(\S+)\s+-\s+(\S+)\s*$)");
        static const std::regex op_space_regex(R"((<=|>=|<|>|=|~>|~|\^)\s+)");

        std::smatch match;
        if (std::regex_match(text, match, hyphen_regex)) {
            return parse_hyphen(match[1].str(), match[2].str());
        }

        std::string normalized = std::regex_replace(text, op_space_regex, "$1");
        std::istringstream tokens(normalized);
        std::string token;
        ComparatorSet set;
        while (tokens >> token) {
            if (!add_comparator(set, token)) return std::nullopt;
        }
        if (set.empty()) set.push_back(cmp(Op::ANY, {}));
        return set;
    }

    std::optional<Range> parse_range(const std::string& text) {
        Range range;
        size_t start = 0;
        while (true) {
            size_t pos = text.find("||", start);
            std::string part = trim(text.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
            auto set = parse_set(part);
            if (!set) return std::nullopt;
            range.push_back(std::move(*set));
            if (pos == std::string::npos) break;
            start = pos + 2;
        }
        return range;
    }

    bool test_comparator(const Comparator& c, const SemVer& v) {
        if (c.op == Op::ANY) return true;
        int r = compare_semver(v, c.version);
        switch (c.op) {
            case Op::EQ: return r == 0;
            case Op::LT: return r < 0;
            case Op::LTE: return r <= 0;
            case Op::GT: return r > 0;
            case Op::GTE: return r >= 0;
            default: return true;
        }
    }

    bool same_tuple(const SemVer& a, const SemVer& b) {
        return a.major == b.major && a.minor == b.minor && a.patch == b.patch;
    }

    bool test_set(const ComparatorSet& set, const SemVer& v) {
        for (const auto& c : set) {
            if (!test_comparator(c, v)) return false;
        }
        if (v.prerelease.empty()) return true;

        // A prerelease only matches when the range names a prerelease of the same
        // [major, minor, patch]. "-0" sentinels are bounds, not opt-ins.
        for (const auto& c : set) {
            if (c.op == Op::ANY || c.version.prerelease.empty()) continue;
            if (c.version.prerelease.size() == 1 && c.version.prerelease[0] == "0" && c.op == Op::LT) continue;
            if (same_tuple(c.version, v)) return true;
        }
        return false;
    }

    bool test_range(const Range& range, const SemVer& v) {
        return std::any_of(range.begin(), range.end(), [&](const ComparatorSet& set) { return test_set(set, v); });
    }
}

std::string SemVer::to_string() const {
    std::string s = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    for (size_t i = 0; i < prerelease.size(); ++i) {
        s += (i == 0 ? "-" : ".") + prerelease[i];
    }
    return s;
}

std::optional<SemVer> parse_semver(std::string_view text) {
    static const std::regex semver_regex(
        R"(^\s*[v=]*(\d+)\.(\d+)\.(\d+)(?:-([0-9A-Za-z\-]+(?:\.[0-9A-Za-z\-]+)*))?(?:\+[0-9A-Za-z\-]+(?:\.[0-9A-Za-z\-]+)*)?\s*$)");
    std::string s(text);
    std::smatch match;
    if (!std::regex_match(s, match, semver_regex)) return std::nullopt;

    auto major = to_number(match[1].str());
    auto minor = to_number(match[2].str());
    auto patch = to_number(match[3].str());
    if (!major || !minor || !patch) return std::nullopt;

    SemVer v;
    v.major = *major;
    v.minor = *minor;
    v.patch = *patch;
    if (match[4].matched) v.prerelease = split(match[4].str(), '.');
    return v;
}

int compare_semver(const SemVer& a, const SemVer& b) {
    if (a.major != b.major) return a.major < b.major ? -1 : 1;
    if (a.minor != b.minor) return a.minor < b.minor ? -1 : 1;
    if (a.patch != b.patch) return a.patch < b.patch ? -1 : 1;

    if (a.prerelease.empty() && !b.prerelease.empty()) return 1;  // 1.0.0 > 1.0.0-alpha
    if (!a.prerelease.empty() && b.prerelease.empty()) return -1; // 1.0.0-alpha < 1.0.0

    size_t len = std::max(a.prerelease.size(), b.prerelease.size());
    for (size_t i = 0; i < len; ++i) {
        if (i >= a.prerelease.size()) return -1; // 1.0.0-alpha < 1.0.0-alpha.1
        if (i >= b.prerelease.size()) return 1;

        const std::string& part1 = a.prerelease[i];
        const std::string& part2 = b.prerelease[i];
        bool is_num1 = is_numeric(part1);
        bool is_num2 = is_numeric(part2);

        if (is_num1 && is_num2) {
            // Compare by length first so long identifiers never overflow.
            if (part1.size() != part2.size()) return part1.size() < part2.size() ? -1 : 1;
            if (part1 != part2) return part1 < part2 ? -1 : 1;
        } else {
            if (is_num1 && !is_num2) return -1;
            if (!is_num1 && is_num2) return 1;
            if (part1 != part2) return part1 < part2 ? -1 : 1;
        }
    }
    return 0;
}

bool version_compare(const std::string& v1_str, const std::string& v2_str) {
    auto v1 = parse_semver(v1_str);
    auto v2 = parse_semver(v2_str);
    if (!v1 || !v2) return !v1 && v2;
    return compare_semver(*v1, *v2) < 0;
}

bool version_satisfies(const std::string& version, const std::string& range) {
    auto v = parse_semver(version);
    if (!v) return false;
    auto r = parse_range(range);
    if (!r) return false;
    return test_range(*r, *v);
}

std::optional<std::string> max_satisfying(const std::vector<std::string>& versions, const std::string& range) {
    auto r = parse_range(range);
    if (!r) return std::nullopt;

    std::optional<std::string> best;
    std::optional<SemVer> best_version;
    for (const auto& candidate : versions) {
        auto v = parse_semver(candidate);
        if (!v || !test_range(*r, *v)) continue;
        if (!best_version || compare_semver(*v, *best_version) > 0) {
            best = candidate;
            best_version = std::move(v);
        }
    }
    return best;
}
