#include <catch2/catch.hpp>
#include <semrex/config.hpp>
#include <filesystem>
#include <fstream>

using namespace semrex;

// ===== Parsing =====

TEST_CASE("parse config with regex section", "[config]") {
    auto r = Config::parse(R"(
[regex]
dialect = "ecmascript"
not-equal = "negate"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().match.dialect == Dialect::ECMAScript);
    REQUIRE(r.value().match.not_equal == NotEqualMode::Negate);
    REQUIRE(r.value().dialect_set);
    REQUIRE(r.value().not_equal_set);
}

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = true
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().color == true);
    REQUIRE(r.value().log_level_set);
    REQUIRE(r.value().color_set);
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().match.dialect == Dialect::RE2);
    REQUIRE(r.value().match.not_equal == NotEqualMode::Reject);
    REQUIRE(r.value().log_level == log::Info);
    REQUIRE_FALSE(r.value().dialect_set);
    REQUIRE_FALSE(r.value().log_level_set);
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SemrexError::Config);
    REQUIRE(r.error().line == 1);
}

TEST_CASE("parse config with unknown dialect", "[config]") {
    auto r = Config::parse(R"(
[regex]
dialect = "pcre"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SemrexError::Config);
    REQUIRE(r.error().message.find("'pcre'") != std::string::npos);
    REQUIRE(r.error().message.find("regex.dialect") != std::string::npos);
    REQUIRE_FALSE(r.error().hint.empty());
}

TEST_CASE("parse config with unknown log level", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "loud"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SemrexError::Config);
    REQUIRE(r.error().message.find("log.level") != std::string::npos);
}

TEST_CASE("parse config with unknown not-equal mode", "[config]") {
    auto r = Config::parse(R"(
[regex]
not-equal = "skip"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("regex.not-equal") != std::string::npos);
}

// ===== Merge =====

TEST_CASE("merge overrides only explicit values", "[config]") {
    auto base = Config::parse(R"(
[regex]
dialect = "ecmascript"

[log]
level = "warn"
)").value();

    auto overlay = Config::parse(R"(
[log]
level = "trace"
)").value();

    base.merge(overlay);
    REQUIRE(base.match.dialect == Dialect::ECMAScript);  // preserved
    REQUIRE(base.log_level == log::Trace);               // overridden
    REQUIRE_FALSE(base.color_set);
}

TEST_CASE("effective config layering", "[config]") {
    auto global = Config::parse(R"(
[regex]
dialect = "ecmascript"
not-equal = "negate"

[log]
color = true
)").value();

    auto project = Config::parse(R"(
[regex]
dialect = "re2"
)").value();

    auto cfg = Config::effective(global, project);
    REQUIRE(cfg.match_options().dialect == Dialect::RE2);
    REQUIRE(cfg.match_options().not_equal == NotEqualMode::Negate);
    REQUIRE(cfg.color == true);
}

TEST_CASE("effective with no layers", "[config]") {
    auto cfg = Config::effective(std::nullopt, std::nullopt);
    REQUIRE(cfg.match.dialect == Dialect::RE2);
    REQUIRE(cfg.log_level == log::Info);
}

TEST_CASE("effective with only global", "[config]") {
    auto global = Config::parse(R"(
[regex]
not-equal = "negate"
)").value();

    auto cfg = Config::effective(global, std::nullopt);
    REQUIRE(cfg.match.not_equal == NotEqualMode::Negate);
}

// ===== Loading =====

TEST_CASE("load config from file", "[config]") {
    auto path = std::filesystem::temp_directory_path() / "semrex_test_config.toml";
    {
        std::ofstream out(path);
        out << "[regex]\ndialect = \"ecma\"\n";
    }

    auto r = Config::load(path.string());
    std::filesystem::remove(path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().match.dialect == Dialect::ECMAScript);
}

TEST_CASE("load reports the file on bad values", "[config]") {
    auto path = std::filesystem::temp_directory_path() / "semrex_test_bad_config.toml";
    {
        std::ofstream out(path);
        out << "[log]\nlevel = \"chatty\"\n";
    }

    auto r = Config::load(path.string());
    std::filesystem::remove(path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().file == path.string());
    REQUIRE(r.error().format().find("--> " + path.string()) != std::string::npos);
}

TEST_CASE("load missing file is an IO error", "[config]") {
    auto r = Config::load("/nonexistent/semrex/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SemrexError::IO);
}

// ===== Logging =====

TEST_CASE("apply_logging pushes settings into the logger", "[config]") {
    auto cfg = Config::parse(R"(
[log]
level = "error"
color = false
)").value();

    cfg.apply_logging();
    REQUIRE(log::get_level() == log::Error);
    REQUIRE_FALSE(log::is_color_enabled());

    log::set_level(log::Info);
}

TEST_CASE("global config path contains .semrex", "[config]") {
    auto path = global_config_path();
    if (!path.empty()) {
        REQUIRE(path.find(".semrex") != std::string::npos);
        REQUIRE(path.find("config.toml") != std::string::npos);
    }
}
