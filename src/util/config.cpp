#include <semrex/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace semrex {

static SemrexError config_error(const std::string& key, const std::string& value,
                                const SemrexError& cause) {
    return SemrexError{SemrexError::Config,
        "invalid value '" + value + "' for " + key, cause.hint};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        SemrexError err{SemrexError::Config,
            std::string("config TOML parse error: ") + std::string(e.description())};
        err.line = static_cast<int>(e.source().begin.line);
        return err;
    }

    Config cfg;

    // [regex] section
    if (auto regex = doc["regex"].as_table()) {
        if (auto v = (*regex)["dialect"].value<std::string>()) {
            auto d = parse_dialect(*v);
            if (d.is_err()) return config_error("regex.dialect", *v, d.error());
            cfg.match.dialect = d.value();
            cfg.dialect_set = true;
        }
        if (auto v = (*regex)["not-equal"].value<std::string>()) {
            auto m = parse_not_equal_mode(*v);
            if (m.is_err()) return config_error("regex.not-equal", *v, m.error());
            cfg.match.not_equal = m.value();
            cfg.not_equal_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return config_error("log.level", *v, lvl.error());
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.color = *v;
            cfg.color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SemrexError{SemrexError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        SemrexError err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.dialect_set) {
        match.dialect = other.match.dialect;
        dialect_set = true;
    }
    if (other.not_equal_set) {
        match.not_equal = other.match.not_equal;
        not_equal_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

void Config::apply_logging() const {
    log::set_level(log_level);
    if (color_set) log::set_color_enabled(color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.semrex/config.toml";
}

} // namespace semrex
