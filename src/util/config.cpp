#include <resx/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace resx {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ResxError{ResxError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [entry] section
    if (auto entry = doc["entry"].as_table()) {
        if (auto node = entry->get("invariant-marker")) {
            auto v = node->value<std::string>();
            if (!v || v->empty()) {
                return ResxError{ResxError::Config,
                    "entry.invariant-marker must be a non-empty string",
                    "the default marker is \"@Invariant\""};
            }
            cfg.entry.invariant_marker = *v;
            cfg.invariant_marker_set = true;
        }
    }

    // [validation] section
    if (auto validation = doc["validation"].as_table()) {
        if (auto node = validation->get("format-parameters")) {
            auto v = node->value<bool>();
            if (!v) {
                return ResxError{ResxError::Config,
                    "validation.format-parameters must be a boolean"};
            }
            cfg.validation.format_parameters = *v;
            cfg.format_parameters_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = lg->get("level")) {
            auto v = node->value<std::string>();
            log::Level lvl;
            if (!v || !log::parse_level(*v, lvl)) {
                return ResxError{ResxError::Config,
                    "invalid log.level",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log.level = lvl;
            cfg.log_level_set = true;
        }
        if (auto node = lg->get("color")) {
            auto v = node->value<bool>();
            if (!v) {
                return ResxError{ResxError::Config,
                    "log.color must be a boolean"};
            }
            cfg.log.color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ResxError{ResxError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.invariant_marker_set) {
        entry.invariant_marker = other.entry.invariant_marker;
        invariant_marker_set = true;
    }
    if (other.format_parameters_set) {
        validation.format_parameters = other.validation.format_parameters;
        format_parameters_set = true;
    }
    if (other.log_level_set) {
        log.level = other.log.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log.color = other.log.color;
        log_color_set = true;
    }
}

void Config::apply_logging() const {
    log::set_level(log.level);
    if (log_color_set) {
        log::set_color_enabled(log.color);
    }
}

Config Config::effective(const std::optional<Config>& user,
                         const std::optional<Config>& project) {
    Config result;
    if (user.has_value()) result.merge(user.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

std::string user_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.resx/config.toml";
}

} // namespace resx
