#pragma once

#include <semrex/result.hpp>
#include <string>

namespace semrex {

enum class Operator {
    Exact,        // 1.2.3, =1.2.3, ==1.2.3
    GreaterEq,    // >=1.2.3
    LessEq,       // <=1.2.3
    Greater,      // >1.2.3
    Less,         // <1.2.3
    NotEqual,     // !=1.2.3
    Caret,        // ^1.2.3 (npm: compatible within major)
    Tilde,        // ~1.2.3 (npm: compatible within minor)
    Pessimistic,  // ~>1.2.3 (Ruby, same as tilde)
    Compatible,   // ~=1.2.3 (Python, same as tilde)
    MavenRange,   // [1.0,2.0)
};

// Canonical prefix for an operator; "" for MavenRange, "==" for Exact.
const char* operator_symbol(Operator op);

// Inverse of operator_symbol(); "=" is also accepted for Exact.
Result<Operator> parse_operator(const std::string& symbol);

// Operator plus the version literal it applies to. For MavenRange the
// literal keeps its brackets: "[1.0,2.0)".
struct Constraint {
    Operator op = Operator::Exact;
    std::string version;

    // Strip a leading operator (longest first); no operator means Exact.
    static Constraint parse(const std::string& raw);
    std::string to_string() const;
};

} // namespace semrex
