#pragma once

#include <semrex/constraint.hpp>
#include <semrex/pattern/boundary.hpp>
#include <semrex/result.hpp>
#include <string>

namespace semrex {

// Regex engine a pattern is meant for.
enum class Dialect {
    RE2,         // no lookaround
    ECMAScript,  // std::regex, supports negative lookahead
};

const char* dialect_name(Dialect d);
Result<Dialect> parse_dialect(const std::string& name);
bool supports_lookahead(Dialect d);

// True for operators whose pattern relies on negative lookahead.
bool requires_lookahead(Operator op);

// Anchored pattern matching exactly the versions that satisfy `c`.
// Errors: Parse for non-numeric components, UnsupportedOperator for an
// operator outside the known set.
Result<std::string> compile_pattern(const Constraint& c);

// As above, but refuses patterns the dialect cannot express
// (DialectUnsupported for != under RE2).
Result<std::string> compile_pattern(const Constraint& c, Dialect dialect);

// Parse `raw` with Constraint::parse() and compile it.
Result<std::string> constraint_to_pattern(const std::string& raw);

// ---- Per-operator builders ----

// Literal match. Segments are quoted as written, so no numeric parsing
// happens; wildcard, Go module and NuGet literals are routed to their
// formatters. Without an explicit suffix any pre-release/build is allowed.
std::string exact_pattern(const std::string& version);

// >=, >, <=, < built from boundary(); < 0.0.0 gives kNeverPattern.
Result<std::string> comparison_pattern(const std::string& version, Bound bound);

// ^M.m.p: major pinned (minor pinned too while major is 0)
Result<std::string> caret_pattern(const std::string& version);

// ~M.m.p, ~>M.m.p, ~=M.m.p: major and minor pinned
Result<std::string> tilde_pattern(const std::string& version);

// ^(?!exact$)<any version>$ -- needs negative lookahead
Result<std::string> not_equal_pattern(const std::string& version);

// Any version of the shape accepted by not_equal_pattern(), without the
// exclusion. Used to emulate != in dialects without lookahead.
std::string any_version_pattern();

} // namespace semrex
