#pragma once

#include <semrex/log.hpp>
#include <semrex/pattern/matcher.hpp>
#include <semrex/result.hpp>
#include <optional>
#include <string>

namespace semrex {

// Layered configuration: global (~/.semrex/config.toml) then project
// (./semrex.toml). Later layers override only the keys they set.
//
//   [regex]
//   dialect = "re2"          # or "ecmascript"
//   not-equal = "reject"     # or "negate"
//
//   [log]
//   level = "info"
//   color = true
struct Config {
    MatchOptions match;
    log::Level log_level = log::Info;
    bool color = false;

    // Track which fields were explicitly set (for merge)
    bool dialect_set = false;
    bool not_equal_set = false;
    bool log_level_set = false;
    bool color_set = false;

    const MatchOptions& match_options() const { return match; }

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicit values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Push log level and (if set) color into semrex::log
    void apply_logging() const;
};

std::string global_config_path();

// Name of the per-project config file looked up in the working directory.
constexpr const char* kProjectConfigName = "semrex.toml";

} // namespace semrex
