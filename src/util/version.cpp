#include <semrex/version.hpp>
#include <algorithm>

namespace semrex {

// ---------------------------------------------------------------------------
// VersionLiteral
// ---------------------------------------------------------------------------

VersionLiteral VersionLiteral::split(const std::string& s) {
    VersionLiteral lit;
    std::string main = s;

    size_t plus = main.find('+');
    if (plus != std::string::npos) {
        lit.build = main.substr(plus + 1);
        lit.has_build = true;
        main.erase(plus);
    }

    size_t dash = main.find('-');
    if (dash != std::string::npos) {
        lit.prerelease = main.substr(dash + 1);
        lit.has_prerelease = true;
        main.erase(dash);
    }

    lit.core = std::move(main);
    return lit;
}

std::vector<std::string> VersionLiteral::segments() const {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : core) {
        if (c == '.') {
            segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    segs.push_back(cur);
    return segs;
}

// ---------------------------------------------------------------------------
// Components
// ---------------------------------------------------------------------------

static const char* component_name(size_t index) {
    switch (index) {
        case 0: return "major";
        case 1: return "minor";
        case 2: return "patch";
        case 3: return "revision";
    }
    return "trailing";
}

Result<int64_t> parse_component(const std::string& text, const std::string& what) {
    if (text.empty()) {
        return SemrexError{SemrexError::Parse,
            "invalid " + what + " version: empty component"};
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return SemrexError{SemrexError::Parse,
                "invalid " + what + " version: " + text,
                "version components must be base-10 integers"};
        }
    }

    // Skip leading zeros before checking the digit budget
    size_t first = text.find_first_not_of('0');
    if (first == std::string::npos) return Result<int64_t>::ok(0);
    if (text.size() - first > static_cast<size_t>(kMaxComponentDigits)) {
        return SemrexError{SemrexError::Parse,
            "invalid " + what + " version: " + text + " is out of range",
            "components are limited to " + std::to_string(kMaxComponent)};
    }

    int64_t value = 0;
    for (size_t i = first; i < text.size(); ++i) {
        value = value * 10 + (text[i] - '0');
    }
    return Result<int64_t>::ok(value);
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& s) {
    VersionLiteral lit = VersionLiteral::split(s);
    std::vector<std::string> segs = lit.segments();

    Version v;
    for (size_t i = 0; i < segs.size(); ++i) {
        auto c = parse_component(segs[i], component_name(i))
            .map_error([&](SemrexError e) {
                e.message += " (in '" + s + "')";
                return e;
            });
        SEMREX_TRY(c);
        v.components.push_back(c.value());
    }

    v.major = v.components[0];
    if (v.components.size() > 1) v.minor = v.components[1];
    if (v.components.size() > 2) v.patch = v.components[2];
    v.prerelease = std::move(lit.prerelease);
    v.build = std::move(lit.build);

    if (lit.has_prerelease && v.prerelease.empty()) {
        return SemrexError{SemrexError::Parse,
            "empty pre-release after '-' in '" + s + "'"};
    }
    if (lit.has_build && v.build.empty()) {
        return SemrexError{SemrexError::Parse,
            "empty build metadata after '+' in '" + s + "'"};
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s;
    for (size_t i = 0; i < components.size(); ++i) {
        if (i > 0) s += ".";
        s += std::to_string(components[i]);
    }
    if (components.empty()) {
        s = std::to_string(major) + "." + std::to_string(minor) + "." +
            std::to_string(patch);
    }
    if (!prerelease.empty()) s += "-" + prerelease;
    if (!build.empty()) s += "+" + build;
    return s;
}

std::vector<int64_t> Version::triple() const {
    return {major, minor, patch};
}

// Components compared numerically, absent ones count as 0 ("1.2" == "1.2.0").
static int compare_components(const Version& a, const Version& b) {
    std::vector<int64_t> ca = a.components.empty() ? a.triple() : a.components;
    std::vector<int64_t> cb = b.components.empty() ? b.triple() : b.components;
    size_t n = std::max(ca.size(), cb.size());
    ca.resize(n, 0);
    cb.resize(n, 0);
    for (size_t i = 0; i < n; ++i) {
        if (ca[i] != cb[i]) return ca[i] < cb[i] ? -1 : 1;
    }
    return 0;
}

bool Version::operator==(const Version& o) const {
    return compare_components(*this, o) == 0 && prerelease == o.prerelease;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    int c = compare_components(*this, o);
    if (c != 0) return c < 0;
    // Pre-release sorts before the release it precedes
    if (prerelease.empty() && !o.prerelease.empty()) return false;
    if (!prerelease.empty() && o.prerelease.empty()) return true;
    return prerelease < o.prerelease;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

} // namespace semrex
