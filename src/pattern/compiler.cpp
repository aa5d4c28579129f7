#include <semrex/pattern/compiler.hpp>
#include <semrex/pattern/ecosystem.hpp>
#include <semrex/pattern/fragments.hpp>
#include <semrex/pattern/maven.hpp>
#include <semrex/log.hpp>
#include <semrex/version.hpp>

namespace semrex {

// ---------------------------------------------------------------------------
// Dialects
// ---------------------------------------------------------------------------

const char* dialect_name(Dialect d) {
    switch (d) {
        case Dialect::RE2:        return "re2";
        case Dialect::ECMAScript: return "ecmascript";
    }
    return "unknown";
}

Result<Dialect> parse_dialect(const std::string& name) {
    if (name == "re2") return Result<Dialect>::ok(Dialect::RE2);
    if (name == "ecmascript" || name == "ecma") return Result<Dialect>::ok(Dialect::ECMAScript);
    return SemrexError{SemrexError::InvalidArg,
        "unknown regex dialect '" + name + "'",
        "expected 're2' or 'ecmascript'"};
}

bool supports_lookahead(Dialect d) {
    return d == Dialect::ECMAScript;
}

bool requires_lookahead(Operator op) {
    return op == Operator::NotEqual;
}

// ---------------------------------------------------------------------------
// Exact
// ---------------------------------------------------------------------------

std::string exact_pattern(const std::string& version) {
    if (is_wildcard_version(version)) return wildcard_pattern(version);
    if (is_go_module_version(version)) return go_module_pattern(version);
    if (is_nuget_version(version)) return nuget_pattern(version);

    VersionLiteral lit = VersionLiteral::split(version);
    std::vector<std::string> segs = lit.segments();

    std::string body;
    for (size_t i = 0; i < segs.size(); ++i) {
        if (i > 0) body += kDot;
        body += quote_meta(segs[i]);
    }

    body += lit.has_prerelease ? quote_meta("-" + lit.prerelease) : kPreRelease;
    body += lit.has_build ? quote_meta("+" + lit.build) : kBuildMeta;
    return anchor(body);
}

// ---------------------------------------------------------------------------
// Comparisons
// ---------------------------------------------------------------------------

Result<std::string> comparison_pattern(const std::string& version, Bound bound) {
    auto v = Version::parse(version);
    if (v.is_err()) return std::move(v).error();

    // Four-part (NuGet) operands are bounded on all four components
    const Version& ver = v.value();
    std::vector<int64_t> components =
        ver.components.size() == 4 ? ver.components : ver.triple();

    std::string body = boundary(components, bound);
    if (is_never(body)) {
        log::debug("'%s%s' has no satisfying versions", bound_symbol(bound),
                   version.c_str());
        return Result<std::string>::ok(kNeverPattern);
    }
    return Result<std::string>::ok(anchor(body + kSuffix));
}

// ---------------------------------------------------------------------------
// Compatible-release operators
// ---------------------------------------------------------------------------

Result<std::string> caret_pattern(const std::string& version) {
    auto v = Version::parse(version);
    if (v.is_err()) return std::move(v).error();

    // 0.x releases are unstable: minor plays the role of major
    std::string body = std::to_string(v.value().major) + kDot;
    if (v.value().major == 0) {
        body += std::to_string(v.value().minor) + kDot + kDigits;
    } else {
        body += std::string(kDigits) + kDot + kDigits;
    }
    return Result<std::string>::ok(anchor(body + kSuffix));
}

Result<std::string> tilde_pattern(const std::string& version) {
    auto v = Version::parse(version);
    if (v.is_err()) return std::move(v).error();

    std::string body = std::to_string(v.value().major) + kDot +
                       std::to_string(v.value().minor) + kDot + kDigits;
    return Result<std::string>::ok(anchor(body + kSuffix));
}

// ---------------------------------------------------------------------------
// Not-equal
// ---------------------------------------------------------------------------

std::string any_version_pattern() {
    return anchor(std::string(kDigits) + R"((?:\.\d+)?(?:\.\d+)?)" + kSuffix);
}

Result<std::string> not_equal_pattern(const std::string& version) {
    std::string excluded = strip_anchors(exact_pattern(version));
    return Result<std::string>::ok(
        "^(?!" + excluded + "$)" + strip_anchors(any_version_pattern()) + "$");
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

Result<std::string> compile_pattern(const Constraint& c) {
    const std::string& version = c.version;

    switch (c.op) {
    case Operator::Exact:
        return Result<std::string>::ok(exact_pattern(version));
    case Operator::GreaterEq:
        return comparison_pattern(version, Bound::AtLeast);
    case Operator::LessEq:
        return comparison_pattern(version, Bound::AtMost);
    case Operator::Greater:
        return comparison_pattern(version, Bound::Greater);
    case Operator::Less:
        return comparison_pattern(version, Bound::Less);
    case Operator::NotEqual:
        return not_equal_pattern(version);
    case Operator::Caret:
        return caret_pattern(version);
    case Operator::Tilde:
    case Operator::Pessimistic:
    case Operator::Compatible:
        return tilde_pattern(version);
    case Operator::MavenRange:
        return maven_range_pattern(version);
    }

    return SemrexError{SemrexError::UnsupportedOperator,
        "unsupported operator: #" + std::to_string(static_cast<int>(c.op)) +
            " in constraint on '" + version + "'"};
}

Result<std::string> compile_pattern(const Constraint& c, Dialect dialect) {
    if (requires_lookahead(c.op) && !supports_lookahead(dialect)) {
        log::warn("'%s' needs negative lookahead, which %s does not support",
                  c.to_string().c_str(), dialect_name(dialect));
        return SemrexError{SemrexError::DialectUnsupported,
            "operator '" + std::string(operator_symbol(c.op)) +
                "' in '" + c.to_string() + "' requires negative lookahead, "
                "not available in the " + dialect_name(dialect) + " dialect",
            "use the ecmascript dialect or set not-equal = \"negate\""};
    }

    auto pattern = compile_pattern(c);
    if (pattern.is_ok()) {
        log::debug("compiled '%s' -> %s", c.to_string().c_str(),
                   pattern.value().c_str());
    }
    return pattern;
}

Result<std::string> constraint_to_pattern(const std::string& raw) {
    return compile_pattern(Constraint::parse(raw));
}

} // namespace semrex
