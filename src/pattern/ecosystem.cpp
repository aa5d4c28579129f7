#include <semrex/pattern/ecosystem.hpp>
#include <semrex/pattern/fragments.hpp>
#include <semrex/version.hpp>
#include <vector>

namespace semrex {

// ---------------------------------------------------------------------------
// Wildcards
// ---------------------------------------------------------------------------

bool is_wildcard_version(const std::string& version) {
    return version.find('*') != std::string::npos;
}

std::string wildcard_pattern(const std::string& version) {
    VersionLiteral lit;
    lit.core = version;
    std::vector<std::string> segs = lit.segments();

    std::vector<std::string> parts;
    for (const auto& seg : segs) {
        parts.push_back(seg == "*" ? std::string(kDigits) : quote_meta(seg));
    }
    if (segs.back() == "*") {
        while (parts.size() < 3) parts.push_back(kDigits);
    }

    std::string body;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) body += kDot;
        body += parts[i];
    }
    return anchor(body + kSuffix);
}

// ---------------------------------------------------------------------------
// Go modules
// ---------------------------------------------------------------------------

bool is_go_module_version(const std::string& version) {
    return version.size() > 1 && version[0] == 'v';
}

// v0.0.0-<yyyymmddhhmmss>-<12 char commit hash>
static bool is_pseudo_version(const std::string& clean) {
    size_t first = clean.find('-');
    if (first == std::string::npos || clean.substr(0, first) != "0.0.0") return false;
    size_t second = clean.find('-', first + 1);
    if (second == std::string::npos) return false;
    std::string timestamp = clean.substr(first + 1, second - first - 1);
    std::string rest = clean.substr(second + 1);
    std::string hash = rest.substr(0, rest.find('-'));
    return timestamp.size() == 14 && hash.size() == 12;
}

std::string go_module_pattern(const std::string& version) {
    std::string clean = version.substr(1);
    if (is_pseudo_version(clean)) {
        return anchor(quote_meta(version));
    }

    VersionLiteral lit = VersionLiteral::split(clean);
    std::string body = "v";
    std::vector<std::string> segs = lit.segments();
    for (size_t i = 0; i < segs.size(); ++i) {
        if (i > 0) body += kDot;
        body += quote_meta(segs[i]);
    }

    if (lit.has_prerelease) {
        body += quote_meta("-" + lit.prerelease);
        body += R"((?:[.\-][a-zA-Z0-9\-\.]+)?)";
    } else {
        body += kPreRelease;
    }
    body += lit.has_build ? quote_meta("+" + lit.build) : kBuildMeta;
    return anchor(body);
}

// ---------------------------------------------------------------------------
// NuGet
// ---------------------------------------------------------------------------

static bool has_nuget_tag(const std::string& prerelease) {
    for (const char* tag : {"alpha", "beta", "rc", "preview"}) {
        if (prerelease.compare(0, std::char_traits<char>::length(tag), tag) == 0) {
            return true;
        }
    }
    return false;
}

bool is_nuget_version(const std::string& version) {
    VersionLiteral lit = VersionLiteral::split(version);
    return lit.segments().size() == 4 ||
           (lit.has_prerelease && has_nuget_tag(lit.prerelease));
}

std::string nuget_pattern(const std::string& version) {
    VersionLiteral lit = VersionLiteral::split(version);
    std::vector<std::string> segs = lit.segments();

    std::string body;
    for (size_t i = 0; i < segs.size(); ++i) {
        if (i > 0) body += kDot;
        body += quote_meta(segs[i]);
    }

    if (lit.has_prerelease || lit.has_build) {
        if (lit.has_prerelease) body += quote_meta("-" + lit.prerelease);
        if (lit.has_build) body += quote_meta("+" + lit.build);
    } else {
        body += R"((?:-(?:alpha|beta|rc|preview)(?:\d+)?(?:\.\d+)?)?)";
    }
    return anchor(body);
}

} // namespace semrex
