// demo_match.cpp
//
// Compile a version constraint to a regular expression and test candidate
// versions against it. Run it with:
//
//     ./demo_match '^1.2.3' 1.2.3 1.2.5 1.3.0 2.0.0
//     ./demo_match '[1.0,2.0)' 1.5.0 2.0.0
//     ./demo_match '!=1.2.3' 1.2.3 1.2.4     # needs dialect = "ecmascript"
//                                           # or not-equal = "negate"
//
// Settings come from ~/.semrex/config.toml and ./semrex.toml.

#include <semrex/config.hpp>
#include <semrex/log.hpp>
#include <semrex/pattern/matcher.hpp>
#include <semrex/result.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace semrex;

// Load one config layer; a missing file is not an error.
static Result<std::optional<Config>> load_layer(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    if (cfg.is_err()) return std::move(cfg).error();
    log::debug("loaded config %s", path.c_str());
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

static Result<Config> load_config() {
    auto global = load_layer(global_config_path());
    SEMREX_TRY(global);
    auto project = load_layer(kProjectConfigName);
    SEMREX_TRY(project);
    return Result<Config>::ok(Config::effective(global.value(), project.value()));
}

static Status run(int argc, char** argv) {
    if (argc < 2) {
        return SemrexError{
            SemrexError::InvalidArg,
            "no version constraint specified",
            "usage: demo_match <constraint> [version...]"
        };
    }

    auto cfg = load_config();
    SEMREX_TRY(cfg);
    cfg.value().apply_logging();

    std::string constraint = argv[1];
    auto matcher = version_to_matcher(constraint, cfg.value().match_options());
    SEMREX_TRY(matcher);

    const Matcher& m = matcher.value();
    std::cout << "Version constraint: " << constraint << "\n";
    std::cout << "Generated regex: " << m.pattern() << "\n";
    std::cout << "Dialect: " << dialect_name(m.dialect())
              << (m.negated() ? " (negated)" : "") << "\n";

    if (argc > 2) {
        std::cout << "\nTesting versions:\n";
        for (int i = 2; i < argc; ++i) {
            std::cout << "  " << argv[i] << ": "
                      << (m.matches(argv[i]) ? "true" : "false") << "\n";
        }
    }
    return ok_status();
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
