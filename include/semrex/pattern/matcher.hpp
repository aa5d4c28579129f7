#pragma once

#include <semrex/constraint.hpp>
#include <semrex/pattern/compiler.hpp>
#include <semrex/result.hpp>
#include <memory>
#include <string>

namespace semrex {

// What to do with != when the dialect has no lookahead.
enum class NotEqualMode {
    Reject,  // fail with DialectUnsupported
    Negate,  // match "any version" and "not the exact version" separately
};

const char* not_equal_mode_name(NotEqualMode m);
Result<NotEqualMode> parse_not_equal_mode(const std::string& name);

struct MatchOptions {
    Dialect dialect = Dialect::RE2;
    NotEqualMode not_equal = NotEqualMode::Reject;
};

// A constraint compiled for a regex engine. Immutable after compile(), so
// one instance can be shared between threads.
class Matcher {
public:
    static Result<Matcher> compile(const Constraint& c, const MatchOptions& opts = {});

    // Full-string match of a candidate version.
    bool matches(const std::string& candidate) const;

    // The generated pattern. In negated mode this is the excluded version.
    const std::string& pattern() const { return pattern_; }
    Dialect dialect() const { return dialect_; }
    bool negated() const { return negated_; }

private:
    Matcher() = default;

    struct Engine;
    static Result<std::shared_ptr<const Engine>> build_engine(const std::string& pattern,
                                                              Dialect dialect);

    std::string pattern_;
    Dialect dialect_ = Dialect::RE2;
    bool negated_ = false;
    std::shared_ptr<const Engine> engine_;
    std::shared_ptr<const Engine> domain_;  // negated mode only
};

Result<Matcher> version_to_matcher(const std::string& constraint,
                                   const MatchOptions& opts = {});

// Does `version` satisfy `constraint`?
Result<bool> version_matches(const std::string& version,
                             const std::string& constraint,
                             const MatchOptions& opts = {});

} // namespace semrex
