#include <semrex/pattern/maven.hpp>
#include <semrex/pattern/boundary.hpp>
#include <semrex/pattern/fragments.hpp>
#include <algorithm>

namespace semrex {

static std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

static Result<std::optional<Version>> parse_bound(const std::string& text,
                                                  const char* side,
                                                  const std::string& range) {
    std::string t = trim(text);
    if (t.empty()) return Result<std::optional<Version>>::ok(std::nullopt);

    auto v = Version::parse(t).map_error([&](SemrexError e) {
        e.prefix("invalid Maven range " + std::string(side) + " bound in '" + range + "'");
        return e;
    });
    SEMREX_TRY(v);
    return Result<std::optional<Version>>::ok(std::move(v).value());
}

Result<MavenRange> MavenRange::parse(const std::string& s) {
    std::string r = trim(s);
    if (r.size() < 3) {
        return SemrexError{SemrexError::Parse,
            "invalid Maven range format: " + r,
            "expected e.g. [1.0,2.0) or [1.5,)"};
    }

    char open = r.front();
    char close = r.back();
    if ((open != '[' && open != '(') || (close != ']' && close != ')')) {
        return SemrexError{SemrexError::Parse,
            "invalid Maven range brackets: " + r};
    }

    std::string content = r.substr(1, r.size() - 2);
    MavenRange range;
    range.lower_inclusive = open == '[';
    range.upper_inclusive = close == ']';

    size_t comma = content.find(',');
    if (comma == std::string::npos) {
        // [1.2] pins a single version
        if (open != '[' || close != ']') {
            return SemrexError{SemrexError::Parse,
                "invalid Maven range format: " + r,
                "a single version must use square brackets: [1.0]"};
        }
        auto pinned = parse_bound(content, "pinned", r);
        if (pinned.is_err()) return std::move(pinned).error();
        if (!pinned.value()) {
            return SemrexError{SemrexError::Parse,
                "empty Maven range: " + r};
        }
        range.lower = pinned.value();
        range.upper = pinned.value();
        range.pinned = true;
        return Result<MavenRange>::ok(std::move(range));
    }

    if (content.find(',', comma + 1) != std::string::npos) {
        return SemrexError{SemrexError::Parse,
            "invalid Maven range format: " + r,
            "a range has exactly one comma"};
    }

    auto lower = parse_bound(content.substr(0, comma), "lower", r);
    if (lower.is_err()) return std::move(lower).error();
    auto upper = parse_bound(content.substr(comma + 1), "upper", r);
    if (upper.is_err()) return std::move(upper).error();

    range.lower = std::move(lower).value();
    range.upper = std::move(upper).value();
    return Result<MavenRange>::ok(std::move(range));
}

std::string MavenRange::to_string() const {
    std::string s(1, lower_inclusive ? '[' : '(');
    if (lower) s += lower->to_string();
    if (!pinned) {
        s += ",";
        if (upper) s += upper->to_string();
    }
    s += upper_inclusive ? ']' : ')';
    return s;
}

// Four-part (NuGet-style) bounds keep all four components, padded to `width`
static std::vector<int64_t> bound_components(const Version& v, size_t width) {
    std::vector<int64_t> c = v.components.size() == 4 ? v.components : v.triple();
    if (c.size() < width) c.resize(width, 0);
    return c;
}

static size_t bound_width(const Version& v) {
    return v.components.size() == 4 ? 4 : 3;
}

// A pin carries its own suffix literally, like an exact version does
static std::string pinned_suffix(const Version& v) {
    std::string s = v.prerelease.empty() ? std::string(kPreRelease)
                                         : quote_meta("-" + v.prerelease);
    s += v.build.empty() ? std::string(kBuildMeta) : quote_meta("+" + v.build);
    return s;
}

std::string maven_range_pattern(const MavenRange& range) {
    std::string body;
    std::string suffix = kSuffix;
    if (range.lower && range.upper) {
        size_t width = std::max(bound_width(*range.lower), bound_width(*range.upper));
        body = range_boundary(bound_components(*range.lower, width), range.lower_inclusive,
                              bound_components(*range.upper, width), range.upper_inclusive);
        if (range.pinned) suffix = pinned_suffix(*range.lower);
    } else if (range.lower) {
        body = boundary(bound_components(*range.lower, 0),
            range.lower_inclusive ? Bound::AtLeast : Bound::Greater);
    } else if (range.upper) {
        body = boundary(bound_components(*range.upper, 0),
            range.upper_inclusive ? Bound::AtMost : Bound::Less);
    } else {
        body = kSemverCore;
    }

    if (is_never(body)) return kNeverPattern;
    return anchor(body + suffix);
}

Result<std::string> maven_range_pattern(const std::string& s) {
    auto range = MavenRange::parse(s);
    if (range.is_err()) return std::move(range).error();
    return Result<std::string>::ok(maven_range_pattern(range.value()));
}

} // namespace semrex
