#pragma once

#include <string>

namespace semrex {

// ---- Wildcards: "1.*", "1.2.*", "1.*.3" ----

bool is_wildcard_version(const std::string& version);

// '*' segments become \d+; a trailing '*' pads the version to three
// components ("1.*" matches 1.x.y).
std::string wildcard_pattern(const std::string& version);

// ---- Go modules: "v1.2.3", "v0.0.0-20210101000000-abcdef123456" ----

bool is_go_module_version(const std::string& version);

// Pseudo-versions match only themselves. A tagged pre-release also
// accepts dotted or dashed refinements ("v1.2.3-alpha" -> "v1.2.3-alpha.1").
std::string go_module_pattern(const std::string& version);

// ---- NuGet: "1.2.3.4567", "1.0.0-beta001" ----

// Four segments, or a pre-release tag NuGet commonly uses
// (alpha, beta, rc, preview).
bool is_nuget_version(const std::string& version);

std::string nuget_pattern(const std::string& version);

} // namespace semrex
