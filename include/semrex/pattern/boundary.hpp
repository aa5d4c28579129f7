#pragma once

#include <semrex/version.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace semrex {

enum class Bound {
    AtLeast,   // >=
    Greater,   // >
    AtMost,    // <=
    Less,      // <
};

const char* bound_symbol(Bound b);

// Disjoint clauses covering every dotted numeric version on one side of
// `components` (compared left to right). For >= 1.2.3:
//
//   ge(2).\d+.\d+  |  1.ge(3).\d+  |  1.2.ge(3)
//
// Clauses with no solutions are dropped, so the list may be empty
// (e.g. < 0.0.0).
std::vector<std::string> boundary_clauses(const std::vector<int64_t>& components,
                                          Bound bound);

// boundary_clauses() joined into one unanchored fragment; kNever when empty.
std::string boundary(const std::vector<int64_t>& components, Bound bound);
std::string boundary(const Version& v, Bound bound);

// Versions between two bounds of equal component count. Each side is
// inclusive or exclusive on its own.
std::string range_boundary(const std::vector<int64_t>& lower, bool lower_inclusive,
                           const std::vector<int64_t>& upper, bool upper_inclusive);

} // namespace semrex
