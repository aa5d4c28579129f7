#pragma once

#include <string>
#include <vector>

namespace semrex {

// Shared regex fragments. All of them compile under RE2 and ECMAScript.
inline constexpr char kDigits[] = R"(\d+)";
inline constexpr char kDot[] = R"(\.)";
inline constexpr char kPreRelease[] = R"((?:-[a-zA-Z0-9\-\.]+)?)";
inline constexpr char kBuildMeta[] = R"((?:\+[a-zA-Z0-9\-\.]+)?)";
inline constexpr char kSuffix[] = R"((?:-[a-zA-Z0-9\-\.]+)?(?:\+[a-zA-Z0-9\-\.]+)?)";

// major.minor.patch with any numbers
inline constexpr char kSemverCore[] = R"(\d+\.\d+\.\d+)";

// Matches nothing, not even the empty string
inline constexpr char kNever[] = R"(\b\B)";
inline constexpr char kNeverPattern[] = R"(^\b\B$)";

// Escape regex metacharacters so `literal` matches itself.
std::string quote_meta(const std::string& literal);

// "^" + body + "$"
std::string anchor(const std::string& body);

// Inverse of anchor(); leaves unanchored input untouched.
std::string strip_anchors(const std::string& pattern);

// Zero alternatives -> kNever, one -> itself, several -> (?:a|b|...)
std::string join_alternatives(const std::vector<std::string>& alternatives);

// `count` arbitrary digits: "", "\d" or "\d{count}"
std::string digit_run(int count);

// Digit class covering lo..hi, a bare digit when lo == hi
std::string digit_class(int lo, int hi);

bool is_never(const std::string& fragment);

} // namespace semrex
