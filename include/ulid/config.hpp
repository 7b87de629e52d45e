#pragma once

#include <ulid/log.hpp>
#include <ulid/result.hpp>
#include <optional>
#include <string>

namespace ulid {

// Settings read from a TOML file:
//
//   [log]
//   level = "debug"
//   color = true
//
// Unset fields stay std::nullopt so that merge() only overrides what a
// layer actually specifies.
struct Config {
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;     // nullopt: detect from the terminal

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    // Push the log settings into ulid::log.
    void apply_logging() const;
};

// $ULID_CONFIG if set, else ~/.ulid/config.toml, else "".
std::string default_config_path();

} // namespace ulid
