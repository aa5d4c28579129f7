#pragma once

#include <cstdint>
#include <string>

namespace semrex {

// Upper bound for in_range() meaning "no upper limit".
constexpr int64_t kUnbounded = -1;

// Fragments matching canonical decimal integers (no sign, no leading
// zeros) on one side of a threshold. Only character classes, alternation
// and counted repetition are used, so the result works in any dialect.
//
//   greater_or_equal(0)   -> \d+
//   greater_or_equal(15)  -> (?:\d{3,}|[2-9]\d|1[5-9])
//   less_or_equal(123)    -> (?:\d|\d{2}|0\d{2}|1[0-1]\d|12[0-3])
//   less_or_equal(-1)     -> kNever
//
// Numbers are capped at kMaxComponent; greater_or_equal() of anything
// above the cap has no solutions and yields kNever.
std::string greater_or_equal(int64_t n);
std::string less_or_equal(int64_t n);

// Integers in [lo, hi]. hi == kUnbounded leaves the range open. Empty
// ranges (lo > hi) yield kNever.
std::string in_range(int64_t lo, int64_t hi);

} // namespace semrex
