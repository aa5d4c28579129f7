#include <semrex/pattern/matcher.hpp>
#include <semrex/log.hpp>
#include <re2/re2.h>
#include <regex>

namespace semrex {

const char* not_equal_mode_name(NotEqualMode m) {
    switch (m) {
        case NotEqualMode::Reject: return "reject";
        case NotEqualMode::Negate: return "negate";
    }
    return "unknown";
}

Result<NotEqualMode> parse_not_equal_mode(const std::string& name) {
    if (name == "reject") return Result<NotEqualMode>::ok(NotEqualMode::Reject);
    if (name == "negate") return Result<NotEqualMode>::ok(NotEqualMode::Negate);
    return SemrexError{SemrexError::InvalidArg,
        "unknown not-equal mode '" + name + "'",
        "expected 'reject' or 'negate'"};
}

// ---------------------------------------------------------------------------
// Engine
// ---------------------------------------------------------------------------

// Exactly one of the two members is set, depending on the dialect.
struct Matcher::Engine {
    std::unique_ptr<re2::RE2> re2;
    std::unique_ptr<std::regex> ecma;

    bool full_match(const std::string& text) const {
        if (re2) return re2::RE2::FullMatch(text, *re2);
        return std::regex_match(text, *ecma);
    }
};

Result<std::shared_ptr<const Matcher::Engine>> Matcher::build_engine(
        const std::string& pattern, Dialect dialect) {
    auto engine = std::make_shared<Engine>();

    if (dialect == Dialect::RE2) {
        engine->re2 = std::make_unique<re2::RE2>(pattern, re2::RE2::Quiet);
        if (!engine->re2->ok()) {
            return SemrexError{SemrexError::Regex,
                "RE2 rejected pattern '" + pattern + "': " + engine->re2->error()};
        }
    } else {
        try {
            engine->ecma = std::make_unique<std::regex>(pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return SemrexError{SemrexError::Regex,
                "std::regex rejected pattern '" + pattern + "': " + e.what()};
        }
    }

    return Result<std::shared_ptr<const Engine>>::ok(std::move(engine));
}

// ---------------------------------------------------------------------------
// Matcher
// ---------------------------------------------------------------------------

Result<Matcher> Matcher::compile(const Constraint& c, const MatchOptions& opts) {
    Matcher m;
    m.dialect_ = opts.dialect;

    bool emulate = c.op == Operator::NotEqual &&
                   !supports_lookahead(opts.dialect) &&
                   opts.not_equal == NotEqualMode::Negate;

    if (emulate) {
        // Accept well-formed versions, then reject the excluded one
        m.negated_ = true;
        m.pattern_ = exact_pattern(c.version);
        log::debug("emulating '%s' without lookahead", c.to_string().c_str());

        auto domain = build_engine(any_version_pattern(), opts.dialect);
        if (domain.is_err()) return std::move(domain).error();
        m.domain_ = std::move(domain).value();
    } else {
        auto pattern = compile_pattern(c, opts.dialect);
        if (pattern.is_err()) return std::move(pattern).error();
        m.pattern_ = std::move(pattern).value();
    }

    auto engine = build_engine(m.pattern_, opts.dialect);
    if (engine.is_err()) return std::move(engine).error();
    m.engine_ = std::move(engine).value();

    return Result<Matcher>::ok(std::move(m));
}

bool Matcher::matches(const std::string& candidate) const {
    if (negated_) {
        return domain_->full_match(candidate) && !engine_->full_match(candidate);
    }
    return engine_->full_match(candidate);
}

Result<Matcher> version_to_matcher(const std::string& constraint,
                                   const MatchOptions& opts) {
    return Matcher::compile(Constraint::parse(constraint), opts);
}

Result<bool> version_matches(const std::string& version,
                             const std::string& constraint,
                             const MatchOptions& opts) {
    auto m = version_to_matcher(constraint, opts);
    if (m.is_err()) return std::move(m).error();
    return Result<bool>::ok(m.value().matches(version));
}

} // namespace semrex
