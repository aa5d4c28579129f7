#pragma once

#include <semrex/result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace semrex {

// Largest value a single version component may take (10 decimal digits).
constexpr int64_t kMaxComponent = 9999999999LL;
constexpr int kMaxComponentDigits = 10;

// Raw pieces of a version literal "core[-prerelease][+build]".
// Build metadata is split off first, so "1.2.3+a-b" has no prerelease.
struct VersionLiteral {
    std::string core;
    std::string prerelease;  // without the leading '-'
    std::string build;       // without the leading '+'
    bool has_prerelease = false;
    bool has_build = false;

    static VersionLiteral split(const std::string& s);
    std::vector<std::string> segments() const;
};

// Numeric version: major.minor.patch[.revision...][-prerelease][+build]
// Missing trailing components default to 0.
struct Version {
    int64_t major = 0;
    int64_t minor = 0;
    int64_t patch = 0;
    std::vector<int64_t> components;  // every component as written
    std::string prerelease;
    std::string build;

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    // {major, minor, patch}
    std::vector<int64_t> triple() const;

    // Build metadata does not take part in ordering or equality.
    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Parse one base-10 component in [0, kMaxComponent].
// `what` names the component in the error ("major", "minor", ...).
Result<int64_t> parse_component(const std::string& text, const std::string& what);

} // namespace semrex
