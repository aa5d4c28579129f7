#include <semrex/pattern/digit_range.hpp>
#include <semrex/pattern/fragments.hpp>
#include <semrex/version.hpp>
#include <vector>

namespace semrex {

// ---- Same digit count ----

// Strings of s.size() digits that compare >= s, each alternative prefixed.
// Position i either raises digit i (anything may follow) or, at the last
// position, accepts s[i] itself.
static void append_at_least(const std::string& prefix, const std::string& s,
                            std::vector<std::string>& out) {
    int len = static_cast<int>(s.size());
    for (int i = 0; i < len; ++i) {
        int digit = s[i] - '0';
        std::string head = prefix + s.substr(0, i);
        if (i == len - 1) {
            out.push_back(head + digit_class(digit, 9));
        } else if (digit < 9) {
            out.push_back(head + digit_class(digit + 1, 9) + digit_run(len - i - 1));
        }
    }
}

// Mirror of append_at_least() for <= s.
static void append_at_most(const std::string& prefix, const std::string& s,
                           std::vector<std::string>& out) {
    int len = static_cast<int>(s.size());
    for (int i = 0; i < len; ++i) {
        int digit = s[i] - '0';
        std::string head = prefix + s.substr(0, i);
        if (i == len - 1) {
            out.push_back(head + digit_class(0, digit));
        } else if (digit > 0) {
            out.push_back(head + digit_class(0, digit - 1) + digit_run(len - i - 1));
        }
    }
}

// Same-length strings in [lo, hi]; requires lo <= hi.
static void append_between(const std::string& lo, const std::string& hi,
                           std::vector<std::string>& out) {
    size_t i = 0;
    while (i < lo.size() && lo[i] == hi[i]) ++i;

    std::string head = lo.substr(0, i);
    if (i == lo.size()) {
        out.push_back(head);
        return;
    }

    int lo_digit = lo[i] - '0';
    int hi_digit = hi[i] - '0';
    int tail = static_cast<int>(lo.size() - i - 1);
    if (tail == 0) {
        out.push_back(head + digit_class(lo_digit, hi_digit));
        return;
    }

    std::string lo_rest = lo.substr(i + 1);
    std::string hi_rest = hi.substr(i + 1);
    bool lo_open = lo_rest.find_first_not_of('0') == std::string::npos;
    bool hi_open = hi_rest.find_first_not_of('9') == std::string::npos;

    if (!lo_open) append_at_least(head + lo[i], lo_rest, out);

    int from = lo_open ? lo_digit : lo_digit + 1;
    int to = hi_open ? hi_digit : hi_digit - 1;
    if (from <= to) out.push_back(head + digit_class(from, to) + digit_run(tail));

    if (!hi_open) append_at_most(head + hi[i], hi_rest, out);
}

// ---- Public ----

std::string greater_or_equal(int64_t n) {
    if (n <= 0) return kDigits;
    if (n > kMaxComponent) return kNever;

    std::string s = std::to_string(n);
    int len = static_cast<int>(s.size());
    std::vector<std::string> alternatives;

    // Any longer number is larger
    if (len < kMaxComponentDigits) {
        alternatives.push_back(R"(\d{)" + std::to_string(len + 1) + ",}");
    }
    append_at_least("", s, alternatives);

    return join_alternatives(alternatives);
}

std::string less_or_equal(int64_t n) {
    if (n < 0) return kNever;

    std::string s = std::to_string(n);
    int len = static_cast<int>(s.size());
    std::vector<std::string> alternatives;

    // Any shorter number is smaller
    for (int shorter = 1; shorter < len; ++shorter) {
        alternatives.push_back(digit_run(shorter));
    }
    append_at_most("", s, alternatives);

    return join_alternatives(alternatives);
}

std::string in_range(int64_t lo, int64_t hi) {
    if (lo < 0) lo = 0;
    if (hi == kUnbounded) return greater_or_equal(lo);
    if (hi > kMaxComponent) hi = kMaxComponent;
    if (lo > hi) return kNever;

    std::string slo = std::to_string(lo);
    std::string shi = std::to_string(hi);
    std::vector<std::string> alternatives;

    if (slo.size() == shi.size()) {
        append_between(slo, shi, alternatives);
        return join_alternatives(alternatives);
    }

    append_between(slo, std::string(slo.size(), '9'), alternatives);

    // Lengths strictly between the two bounds are unconstrained
    int shortest = static_cast<int>(slo.size()) + 1;
    int longest = static_cast<int>(shi.size()) - 1;
    if (shortest <= longest) {
        std::string run = shortest == longest
            ? digit_run(shortest - 1)
            : R"(\d{)" + std::to_string(shortest - 1) + "," +
                  std::to_string(longest - 1) + "}";
        alternatives.push_back("[1-9]" + run);
    }

    append_between("1" + std::string(shi.size() - 1, '0'), shi, alternatives);
    return join_alternatives(alternatives);
}

} // namespace semrex
