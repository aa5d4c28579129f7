#include <semrex/pattern/boundary.hpp>
#include <semrex/pattern/digit_range.hpp>
#include <semrex/pattern/fragments.hpp>
#include <algorithm>

namespace semrex {

const char* bound_symbol(Bound b) {
    switch (b) {
        case Bound::AtLeast: return ">=";
        case Bound::Greater: return ">";
        case Bound::AtMost:  return "<=";
        case Bound::Less:    return "<";
    }
    return "?";
}

static bool is_lower(Bound b) {
    return b == Bound::AtLeast || b == Bound::Greater;
}

// "\.\d+" once for each trailing component left unconstrained
static std::string open_tail(size_t count) {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        out += kDot;
        out += kDigits;
    }
    return out;
}

std::vector<std::string> boundary_clauses(const std::vector<int64_t>& components,
                                          Bound bound) {
    std::vector<std::string> clauses;
    std::string prefix;

    for (size_t i = 0; i < components.size(); ++i) {
        bool last = i + 1 == components.size();
        int64_t value = components[i];
        std::string open;

        // Earlier positions step past the pinned value; the last one
        // includes it unless the bound is strict.
        if (is_lower(bound)) {
            int64_t threshold = (last && bound == Bound::AtLeast) ? value : value + 1;
            open = greater_or_equal(threshold);
        } else {
            int64_t threshold = (last && bound == Bound::AtMost) ? value : value - 1;
            open = less_or_equal(threshold);
        }

        if (!is_never(open)) {
            clauses.push_back(prefix + open + open_tail(components.size() - i - 1));
        }

        prefix += std::to_string(value);
        prefix += kDot;
    }

    return clauses;
}

std::string boundary(const std::vector<int64_t>& components, Bound bound) {
    return join_alternatives(boundary_clauses(components, bound));
}

std::string boundary(const Version& v, Bound bound) {
    return boundary(v.triple(), bound);
}

std::string range_boundary(const std::vector<int64_t>& lower, bool lower_inclusive,
                           const std::vector<int64_t>& upper, bool upper_inclusive) {
    std::vector<std::string> clauses;
    std::string prefix;
    size_t count = std::min(lower.size(), upper.size());

    for (size_t i = 0; i < count; ++i) {
        int64_t lo = lower[i];
        int64_t hi = upper[i];
        if (lo > hi) break;

        if (i + 1 == count) {
            int64_t from = lower_inclusive ? lo : lo + 1;
            int64_t to = upper_inclusive ? hi : hi - 1;
            // to == -1 would read as kUnbounded
            if (to < from) break;
            std::string last = in_range(from, to);
            if (!is_never(last)) clauses.push_back(prefix + last);
            break;
        }

        if (lo == hi) {
            prefix += std::to_string(lo);
            prefix += kDot;
            continue;
        }

        // First diverging component: strictly inside, or pinned to either
        // end with the remaining components bounded on that side only.
        std::string inside = in_range(lo + 1, hi - 1);
        if (!is_never(inside)) {
            clauses.push_back(prefix + inside + open_tail(count - i - 1));
        }

        std::vector<int64_t> lower_rest(lower.begin() + i + 1, lower.begin() + count);
        std::vector<int64_t> upper_rest(upper.begin() + i + 1, upper.begin() + count);
        auto above = boundary_clauses(lower_rest,
            lower_inclusive ? Bound::AtLeast : Bound::Greater);
        auto below = boundary_clauses(upper_rest,
            upper_inclusive ? Bound::AtMost : Bound::Less);

        if (!above.empty()) {
            clauses.push_back(prefix + std::to_string(lo) + kDot + join_alternatives(above));
        }
        if (!below.empty()) {
            clauses.push_back(prefix + std::to_string(hi) + kDot + join_alternatives(below));
        }
        break;
    }

    return join_alternatives(clauses);
}

} // namespace semrex
