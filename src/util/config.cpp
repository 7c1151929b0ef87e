#include <verspec/config.hpp>
#include <toml++/toml.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace verspec {

static VerspecError bad_value(const std::string& key, const std::string& msg,
                              const std::string& hint, const std::string& source) {
    return VerspecError{VerspecError::Config,
        "config key '" + key + "' " + msg, hint, source, 0};
}

Result<Config> Config::parse_source(const std::string& toml_str,
                                    const std::string& source) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source);
    } catch (const toml::parse_error& e) {
        return VerspecError{VerspecError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", source, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [log] section
    if (auto log_tbl = doc["log"].as_table()) {
        for (const auto& [key, val] : *log_tbl) {
            std::string k(key.str());
            if (k == "level") {
                auto s = val.value<std::string>();
                if (!s) {
                    return bad_value("log.level", "must be a string",
                        "e.g. level = \"debug\"", source);
                }
                if (!log::level_from_name(*s, cfg.log_level)) {
                    return bad_value("log.level", "has unknown level '" + *s + "'",
                        "expected one of: trace, debug, info, warn, error", source);
                }
                cfg.log_level_set = true;
            } else if (k == "color") {
                auto b = val.value<bool>();
                if (!b || !val.is_boolean()) {
                    return bad_value("log.color", "must be true or false", "", source);
                }
                cfg.log_color = *b;
                cfg.log_color_set = true;
            } else {
                log::warn("ignoring unknown config key 'log.%s'", k.c_str());
            }
        }
    }

    // [version] section
    if (auto ver_tbl = doc["version"].as_table()) {
        for (const auto& [key, val] : *ver_tbl) {
            std::string k(key.str());
            if (k == "mode") {
                auto s = val.value<std::string>();
                if (!s || (*s != "strict" && *s != "loose")) {
                    return bad_value("version.mode", "must be \"strict\" or \"loose\"",
                        "strict: major.minor.patch; loose: 2 to 4 numeric parts", source);
                }
                cfg.version_mode = *s == "strict" ? ParseMode::Strict : ParseMode::Loose;
                cfg.version_mode_set = true;
            } else {
                log::warn("ignoring unknown config key 'version.%s'", k.c_str());
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::parse(const std::string& toml_str) {
    return parse_source(toml_str, "");
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return VerspecError{VerspecError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_source(ss.str(), path);
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
    if (other.version_mode_set) {
        version_mode = other.version_mode;
        version_mode_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply() const {
    if (log_level_set) log::set_level(log_level);
    if (log_color_set) log::set_color_enabled(log_color);
}

std::optional<Version> Config::try_parse_version(const std::string& text) const {
    return Version::try_parse(text, version_mode);
}

Result<Version> Config::parse_version(const std::string& text) const {
    return Version::parse(text, version_mode);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.verspec/config.toml";
}

} // namespace verspec
