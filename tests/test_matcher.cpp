#include <catch2/catch.hpp>
#include <semrex/pattern/matcher.hpp>
#include <semrex/pattern/fragments.hpp>
#include <atomic>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

using namespace semrex;

static MatchOptions options(Dialect d, NotEqualMode m = NotEqualMode::Reject) {
    MatchOptions opts;
    opts.dialect = d;
    opts.not_equal = m;
    return opts;
}

// ===== Compilation =====

TEST_CASE("default options use RE2", "[matcher]") {
    auto m = version_to_matcher("^1.2.3");
    REQUIRE(m.is_ok());
    REQUIRE(m.value().dialect() == Dialect::RE2);
    REQUIRE_FALSE(m.value().negated());
    REQUIRE(m.value().pattern() == constraint_to_pattern("^1.2.3").value());
}

TEST_CASE("caret matching in both dialects", "[matcher]") {
    for (Dialect d : {Dialect::RE2, Dialect::ECMAScript}) {
        INFO(dialect_name(d));
        auto m = version_to_matcher("^1.2.3", options(d));
        REQUIRE(m.is_ok());
        REQUIRE(m.value().matches("1.2.3"));
        REQUIRE(m.value().matches("1.9.9"));
        REQUIRE_FALSE(m.value().matches("2.0.0"));
        REQUIRE_FALSE(m.value().matches("0.9.9"));
    }
}

TEST_CASE("dialects agree on comparison constraints", "[matcher]") {
    const std::vector<std::string> candidates = {
        "0.0.0", "1.2.2", "1.2.3", "1.2.4", "9.9.9", "10.0.0", "10.10.9",
        "10.10.10", "99.99.100", "1.2.3-rc.1", "2.0.0+build", "1.2",
    };
    for (const char* c : {">=1.2.3", "<10.10.10", ">9.9.9", "<=99.99.99", "[1.0,10.0)",
                          "~1.2.0", "1.2.3-rc.1"}) {
        auto re2_m = version_to_matcher(c, options(Dialect::RE2));
        auto ecma_m = version_to_matcher(c, options(Dialect::ECMAScript));
        REQUIRE(re2_m.is_ok());
        REQUIRE(ecma_m.is_ok());
        for (const auto& v : candidates) {
            INFO(c << " vs " << v);
            REQUIRE(re2_m.value().matches(v) == ecma_m.value().matches(v));
        }
    }
}

TEST_CASE("matches requires the whole string", "[matcher]") {
    auto m = version_to_matcher(">=1.2.3");
    REQUIRE(m.is_ok());
    REQUIRE_FALSE(m.value().matches("x1.2.3"));
    REQUIRE_FALSE(m.value().matches("1.2.3 "));
    REQUIRE_FALSE(m.value().matches(""));
}

TEST_CASE("compile errors propagate", "[matcher]") {
    auto m = version_to_matcher(">=1.x");
    REQUIRE(m.is_err());
    REQUIRE(m.error().code == SemrexError::Parse);

    auto range = version_to_matcher("[1.0");
    REQUIRE(range.is_err());
}

TEST_CASE("less than zero matches nothing", "[matcher]") {
    for (Dialect d : {Dialect::RE2, Dialect::ECMAScript}) {
        auto m = version_to_matcher("<0.0.0", options(d));
        REQUIRE(m.is_ok());
        REQUIRE(m.value().pattern() == kNeverPattern);
        REQUIRE_FALSE(m.value().matches("0.0.0"));
        REQUIRE_FALSE(m.value().matches("0.0.1"));
        REQUIRE_FALSE(m.value().matches(""));
    }
}

// ===== Not-equal =====

TEST_CASE("RE2 rejects not-equal by default", "[matcher][not-equal]") {
    auto m = version_to_matcher("!=1.2.3");
    REQUIRE(m.is_err());
    REQUIRE(m.error().code == SemrexError::DialectUnsupported);
    REQUIRE(m.error().message.find("lookahead") != std::string::npos);
}

TEST_CASE("ECMAScript not-equal uses lookahead", "[matcher][not-equal]") {
    auto m = version_to_matcher("!=1.2.3", options(Dialect::ECMAScript));
    REQUIRE(m.is_ok());
    REQUIRE_FALSE(m.value().negated());
    REQUIRE(m.value().pattern().find("(?!") != std::string::npos);

    for (const char* v : {"1.2.2", "1.2.4", "1.3.0", "2.0.0", "0.9.9"}) {
        INFO(v);
        REQUIRE(m.value().matches(v));
    }
    REQUIRE_FALSE(m.value().matches("1.2.3"));
    REQUIRE_FALSE(m.value().matches("not-a-version"));
}

TEST_CASE("negate mode emulates not-equal under RE2", "[matcher][not-equal]") {
    auto m = version_to_matcher("!=1.2.3", options(Dialect::RE2, NotEqualMode::Negate));
    REQUIRE(m.is_ok());
    REQUIRE(m.value().negated());
    REQUIRE(m.value().pattern() == exact_pattern("1.2.3"));

    for (const char* v : {"1.2.2", "1.2.4", "1.3.0", "2.0.0", "0.9.9"}) {
        INFO(v);
        REQUIRE(m.value().matches(v));
    }
    REQUIRE_FALSE(m.value().matches("1.2.3"));
    REQUIRE_FALSE(m.value().matches("not-a-version"));
}

TEST_CASE("negate mode agrees with lookahead", "[matcher][not-equal]") {
    auto ecma = version_to_matcher("!=10.0.1", options(Dialect::ECMAScript));
    auto negate = version_to_matcher("!=10.0.1", options(Dialect::RE2, NotEqualMode::Negate));
    REQUIRE(ecma.is_ok());
    REQUIRE(negate.is_ok());
    for (const char* v : {"10.0.1", "10.0.0", "10.0.10", "1.0.1", "10.0.1-rc", "10.0",
                          "10", "abc", ""}) {
        INFO(v);
        REQUIRE(ecma.value().matches(v) == negate.value().matches(v));
    }
}

TEST_CASE("negate mode leaves other operators alone", "[matcher][not-equal]") {
    auto m = version_to_matcher(">=1.0.0", options(Dialect::RE2, NotEqualMode::Negate));
    REQUIRE(m.is_ok());
    REQUIRE_FALSE(m.value().negated());
}

TEST_CASE("not-equal mode names", "[matcher][not-equal]") {
    REQUIRE(parse_not_equal_mode("reject").value() == NotEqualMode::Reject);
    REQUIRE(parse_not_equal_mode("negate").value() == NotEqualMode::Negate);
    REQUIRE(std::string(not_equal_mode_name(NotEqualMode::Negate)) == "negate");

    auto bad = parse_not_equal_mode("ignore");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == SemrexError::InvalidArg);
}

// ===== version_matches =====

TEST_CASE("version_matches", "[matcher]") {
    REQUIRE(version_matches("1.5.0", "[1.0,2.0)").value());
    REQUIRE_FALSE(version_matches("2.0.0", "[1.0,2.0)").value());
    REQUIRE(version_matches("1.2.999", "~>1.2.3").value());
    REQUIRE(version_matches("v1.2.3-beta.1", "v1.2.3").value());
    REQUIRE(version_matches("1.2.3", "!=1.2.3").is_err());
}

// ===== Sharing =====

TEST_CASE("one matcher can be shared between threads", "[matcher]") {
    auto m = version_to_matcher(">=10.0.0");
    REQUIRE(m.is_ok());
    const Matcher& shared = m.value();

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&shared, &mismatches, t] {
            for (int i = 0; i < 500; ++i) {
                int major = (i + t) % 20;
                bool expected = major >= 10;
                std::string v = std::to_string(major) + ".0.0";
                if (shared.matches(v) != expected) ++mismatches;
            }
        });
    }
    for (auto& w : workers) w.join();
    REQUIRE(mismatches.load() == 0);
}

TEST_CASE("copies share the compiled engine", "[matcher]") {
    auto m = version_to_matcher("~1.2.3");
    REQUIRE(m.is_ok());
    Matcher copy = m.value();
    REQUIRE(copy.pattern() == m.value().pattern());
    REQUIRE(copy.matches("1.2.9"));
    REQUIRE_FALSE(copy.matches("1.3.0"));
}

TEST_CASE("matchers only come from compile", "[matcher]") {
    STATIC_REQUIRE_FALSE(std::is_default_constructible<Matcher>::value);
    STATIC_REQUIRE(std::is_copy_constructible<Matcher>::value);
}
