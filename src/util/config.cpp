#include <ulid/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace ulid {

static UlidError type_error(const std::string& key, const char* expected) {
    return UlidError(UlidError::Config,
        "config key '" + key + "' must be a " + expected);
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UlidError{UlidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto log_tbl = doc["log"].as_table()) {
        if (auto node = (*log_tbl)["level"]) {
            auto s = node.value<std::string>();
            if (!s) return type_error("log.level", "string");
            auto lvl = log::parse_level(*s);
            ULID_TRY(lvl);
            cfg.log_level = lvl.value();
        }
        if (auto node = (*log_tbl)["color"]) {
            auto b = node.value<bool>();
            if (!b) return type_error("log.color", "boolean");
            cfg.log_color = *b;
        }
    } else if (doc.contains("log")) {
        return type_error("log", "table");
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return UlidError{UlidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
}

void Config::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
}

std::string default_config_path() {
    if (const char* explicit_path = std::getenv("ULID_CONFIG")) {
        return explicit_path;
    }
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.ulid/config.toml";
}

} // namespace ulid
