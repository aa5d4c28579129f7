#pragma once

#include <semrex/result.hpp>
#include <semrex/version.hpp>
#include <optional>
#include <string>
#include <vector>

namespace semrex {

// Maven version range. '[' and ']' are inclusive, '(' and ')' exclusive;
// an empty side is unbounded.
//
//   [1.0,2.0)   1.0 <= v < 2.0
//   [1.5,)      v >= 1.5
//   (,1.0]      v <= 1.0
//   [1.2]       v == 1.2
//
// Bounds with four components (NuGet style) are compared on all four.
struct MavenRange {
    std::optional<Version> lower;
    std::optional<Version> upper;
    bool lower_inclusive = true;
    bool upper_inclusive = true;
    bool pinned = false;  // written as [v]; its pre-release and build must match too

    static Result<MavenRange> parse(const std::string& s);
    std::string to_string() const;
};

// Pattern for a bracketed range; both sides empty matches any
// major.minor.patch version.
Result<std::string> maven_range_pattern(const std::string& s);
std::string maven_range_pattern(const MavenRange& range);

} // namespace semrex
