#pragma once

#include <verspec/log.hpp>
#include <verspec/result.hpp>
#include <verspec/version.hpp>
#include <optional>
#include <string>

namespace verspec {

// Library settings read from TOML:
//
//   [log]
//   level = "debug"     # trace | debug | info | warn | error
//   color = false
//
//   [version]
//   mode = "strict"     # strict | loose
//
// Layers merge field by field; only keys a layer actually sets override.
struct Config {
    log::Level log_level = log::Info;
    bool log_color = false;
    ParseMode version_mode = ParseMode::Loose;

    bool log_level_set = false;
    bool log_color_set = false;
    bool version_mode_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    void merge(const Config& other);

    // global -> local, local wins
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push the [log] settings that were set into verspec::log.
    void apply() const;

    std::optional<Version> try_parse_version(const std::string& text) const;
    Result<Version> parse_version(const std::string& text) const;

private:
    static Result<Config> parse_source(const std::string& toml_str,
                                       const std::string& source);
};

// ~/.verspec/config.toml, or "" when no home directory is known
std::string global_config_path();

} // namespace verspec
