#include <semrex/constraint.hpp>

namespace semrex {

// Multi-character operators come before their single-character prefixes
static const struct {
    const char* symbol;
    Operator op;
} kPrefixes[] = {
    {">=", Operator::GreaterEq},
    {"<=", Operator::LessEq},
    {"!=", Operator::NotEqual},
    {"==", Operator::Exact},
    {"~>", Operator::Pessimistic},
    {"~=", Operator::Compatible},
    {">",  Operator::Greater},
    {"<",  Operator::Less},
    {"=",  Operator::Exact},
    {"^",  Operator::Caret},
    {"~",  Operator::Tilde},
};

static std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

const char* operator_symbol(Operator op) {
    switch (op) {
        case Operator::Exact:       return "==";
        case Operator::GreaterEq:   return ">=";
        case Operator::LessEq:      return "<=";
        case Operator::Greater:     return ">";
        case Operator::Less:        return "<";
        case Operator::NotEqual:    return "!=";
        case Operator::Caret:       return "^";
        case Operator::Tilde:       return "~";
        case Operator::Pessimistic: return "~>";
        case Operator::Compatible:  return "~=";
        case Operator::MavenRange:  return "";
    }
    return "";
}

Result<Operator> parse_operator(const std::string& symbol) {
    for (const auto& p : kPrefixes) {
        if (symbol == p.symbol) return Result<Operator>::ok(p.op);
    }
    return SemrexError{SemrexError::UnsupportedOperator,
        "unsupported operator: " + symbol,
        "expected one of: >= <= != == ~> ~= > < = ^ ~"};
}

Constraint Constraint::parse(const std::string& raw) {
    std::string s = trim(raw);
    Constraint c;

    if (!s.empty() && (s[0] == '[' || s[0] == '(')) {
        c.op = Operator::MavenRange;
        c.version = s;
        return c;
    }

    for (const auto& p : kPrefixes) {
        std::string symbol = p.symbol;
        if (s.compare(0, symbol.size(), symbol) == 0) {
            c.op = p.op;
            c.version = trim(s.substr(symbol.size()));
            return c;
        }
    }

    c.version = s;
    return c;
}

std::string Constraint::to_string() const {
    return operator_symbol(op) + version;
}

} // namespace semrex
